#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <relcheck/core/types.h>
#include <relcheck/validation/case_result.h>

namespace relcheck::report {

/// Bucket for cases that carry no category.
inline constexpr const char* kUncategorized = "uncategorized";

struct CategoryStats {
    std::size_t total = 0;
    std::size_t passed = 0;

    double passRate() const {
        return total == 0 ? 0.0 : static_cast<double>(passed) / static_cast<double>(total);
    }
};

enum class RunStatus { Success, Failed };

const char* runStatusName(RunStatus status);

/**
 * Aggregated outcome of one run. Produced by RunAggregator::seal(); results are in
 * the input order of the test cases.
 */
struct RunSummary {
    std::string runId;
    TimePoint startedAt{};
    TimePoint finishedAt{};
    std::size_t totalCases = 0;
    std::size_t passCount = 0;
    std::map<validation::Outcome, std::size_t> failCounts; // every non-pass outcome present
    std::map<std::string, CategoryStats> perCategoryStats;
    std::vector<validation::CaseResult> results;

    /// Percentage of passing cases, 0..100.
    double successRate() const {
        return totalCases == 0 ? 0.0
                               : 100.0 * static_cast<double>(passCount) /
                                     static_cast<double>(totalCases);
    }

    RunStatus status() const {
        return totalCases > 0 && passCount == totalCases ? RunStatus::Success
                                                         : RunStatus::Failed;
    }

    std::size_t count(validation::Outcome outcome) const;
};

/// Run id "YYYYMMDD_HHMMSS_<6 hex>".
std::string generateRunId(TimePoint now);

} // namespace relcheck::report
