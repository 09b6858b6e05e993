#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <relcheck/core/types.h>
#include <relcheck/registry/test_case.h>
#include <relcheck/report/run_summary.h>

namespace relcheck::report {

/**
 * @brief Collects case results from concurrent workers into a RunSummary.
 *
 * The set of expected case ids is fixed at construction. Each id is accepted once;
 * results for unknown or already-reported ids are rejected, and nothing is accepted
 * after seal(). One mutex guards all state.
 */
class RunAggregator {
public:
    RunAggregator(std::string runId, const std::vector<registry::TestCase>& cases,
                  TimePoint startedAt);

    RunAggregator(const RunAggregator&) = delete;
    RunAggregator& operator=(const RunAggregator&) = delete;

    /// InvalidArgument for unknown ids, InvalidState for duplicates or after seal().
    Result<void> record(validation::CaseResult result);

    /// Record an Error outcome for every case that has not reported yet.
    /// @return number of cases filled in
    std::size_t fillMissing(const std::string& detail);

    bool isReported(const std::string& caseId) const;
    std::size_t reportedCount() const;
    std::size_t expectedCount() const { return cases_.size(); }
    bool sealed() const;

    /**
     * Freeze the aggregator and build the summary. Every expected case must have
     * reported (call fillMissing() first when the run was cut short).
     */
    Result<RunSummary> seal(TimePoint finishedAt);

private:
    std::string runId_;
    TimePoint startedAt_;
    std::vector<registry::TestCase> cases_;
    std::unordered_map<std::string, std::size_t> index_;

    mutable std::mutex mutex_;
    std::vector<std::optional<validation::CaseResult>> slots_;
    std::size_t reported_ = 0;
    bool sealed_ = false;
};

/// Counting step of seal(), exposed for tests. Results must be in final order.
RunSummary summarize(std::string runId, TimePoint startedAt, TimePoint finishedAt,
                     std::vector<validation::CaseResult> results);

} // namespace relcheck::report
