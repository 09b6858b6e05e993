#include <relcheck/report/run_aggregator.h>

#include <relcheck/validation/validation_engine.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace relcheck::report {

RunSummary summarize(std::string runId, TimePoint startedAt, TimePoint finishedAt,
                     std::vector<validation::CaseResult> results) {
    RunSummary s;
    s.runId = std::move(runId);
    s.startedAt = startedAt;
    s.finishedAt = finishedAt;
    s.totalCases = results.size();
    for (auto o : validation::kAllOutcomes) {
        if (o != validation::Outcome::Pass)
            s.failCounts[o] = 0;
    }

    for (const auto& r : results) {
        auto& cat = s.perCategoryStats[r.category.value_or(kUncategorized)];
        ++cat.total;
        if (r.passed()) {
            ++s.passCount;
            ++cat.passed;
        } else {
            ++s.failCounts[r.outcome];
        }
    }
    s.results = std::move(results);
    return s;
}

RunAggregator::RunAggregator(std::string runId, const std::vector<registry::TestCase>& cases,
                             TimePoint startedAt)
    : runId_(std::move(runId)), startedAt_(startedAt), cases_(cases), slots_(cases.size()) {
    for (std::size_t i = 0; i < cases_.size(); ++i) {
        index_.emplace(cases_[i].id, i);
    }
}

Result<void> RunAggregator::record(validation::CaseResult result) {
    auto it = index_.find(result.testCaseId);
    if (it == index_.end()) {
        return Error{ErrorCode::InvalidArgument,
                     "Result for unknown test case '" + result.testCaseId + "'"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_) {
        return Error{ErrorCode::InvalidState,
                     "Run already sealed, dropping result for '" + result.testCaseId + "'"};
    }
    auto& slot = slots_[it->second];
    if (slot) {
        return Error{ErrorCode::InvalidState,
                     "Duplicate result for test case '" + result.testCaseId + "'"};
    }
    slot = std::move(result);
    ++reported_;
    return Result<void>();
}

std::size_t RunAggregator::fillMissing(const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_)
        return 0;
    std::size_t filled = 0;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) {
            slots_[i] = validation::makeErrorResult(cases_[i], detail);
            ++filled;
        }
    }
    reported_ += filled;
    return filled;
}

bool RunAggregator::isReported(const std::string& caseId) const {
    auto it = index_.find(caseId);
    if (it == index_.end())
        return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_[it->second].has_value();
}

std::size_t RunAggregator::reportedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reported_;
}

bool RunAggregator::sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

Result<RunSummary> RunAggregator::seal(TimePoint finishedAt) {
    std::vector<validation::CaseResult> ordered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sealed_) {
            return Error{ErrorCode::InvalidState, "Run " + runId_ + " already sealed"};
        }
        if (reported_ != slots_.size()) {
            return Error{ErrorCode::InvalidState,
                         fmt::format("Run {} has {} of {} results", runId_, reported_,
                                     slots_.size())};
        }
        sealed_ = true;
        ordered.reserve(slots_.size());
        for (auto& slot : slots_) {
            ordered.push_back(std::move(*slot));
        }
    }
    auto summary = summarize(runId_, startedAt_, finishedAt, std::move(ordered));
    spdlog::debug("Sealed run {}: {}/{} passed", summary.runId, summary.passCount,
                  summary.totalCases);
    return summary;
}

} // namespace relcheck::report
