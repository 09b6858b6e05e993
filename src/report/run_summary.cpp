#include <relcheck/report/run_summary.h>

#include <relcheck/core/time_utils.h>

#include <fmt/format.h>

#include <random>

namespace relcheck::report {

const char* runStatusName(RunStatus status) {
    return status == RunStatus::Success ? "success" : "failed";
}

std::size_t RunSummary::count(validation::Outcome outcome) const {
    if (outcome == validation::Outcome::Pass)
        return passCount;
    auto it = failCounts.find(outcome);
    return it == failCounts.end() ? 0 : it->second;
}

std::string generateRunId(TimePoint now) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned> dist(0, 0xFFFFFF);
    return fmt::format("{}_{:06x}", toCompactStamp(now), dist(rng));
}

} // namespace relcheck::report
