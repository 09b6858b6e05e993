#include <relcheck/tools/summary_view.h>

#include <relcheck/core/time_utils.h>

#include <fmt/format.h>

namespace relcheck::tools {

const char* outcomeTag(validation::Outcome outcome) {
    switch (outcome) {
        case validation::Outcome::Pass:
            return "PASS";
        case validation::Outcome::FailNotFound:
            return "NOT FOUND";
        case validation::Outcome::FailRankExceeded:
            return "RANK";
        case validation::Outcome::FailScoreBelowThreshold:
            return "SCORE";
        case validation::Outcome::Error:
            return "ERROR";
    }
    return "ERROR";
}

std::string formatCaseLine(const validation::CaseResult& result, std::size_t done,
                           std::size_t total) {
    const int width = static_cast<int>(std::to_string(total).size());
    return fmt::format("[{:>{}}/{}] {:<9} {} ({:.0f} ms) {}", done, width, total,
                       outcomeTag(result.outcome), result.testCaseId, result.durationMs,
                       result.message);
}

void printSummary(std::ostream& out, const report::RunSummary& summary, bool details) {
    out << fmt::format("\nRun {} ({} .. {})\n", summary.runId,
                       toDisplayString(summary.startedAt), toDisplayString(summary.finishedAt));
    out << fmt::format("  Total:        {}\n", summary.totalCases);
    out << fmt::format("  Passed:       {} ({:.1f}%)\n", summary.passCount,
                       summary.successRate());
    for (const auto& [outcome, n] : summary.failCounts) {
        if (n > 0)
            out << fmt::format("  {:<13} {}\n", std::string(outcomeTag(outcome)) + ":", n);
    }

    if (!summary.perCategoryStats.empty()) {
        out << "\n  Category               Passed   Rate\n";
        for (const auto& [name, stats] : summary.perCategoryStats) {
            out << fmt::format("  {:<22} {:>3}/{:<3} {:>5.1f}%\n", name, stats.passed,
                               stats.total, stats.passRate() * 100.0);
        }
    }

    if (details) {
        bool header = false;
        for (const auto& r : summary.results) {
            if (r.passed())
                continue;
            if (!header) {
                out << "\n  Failing cases:\n";
                header = true;
            }
            out << fmt::format("  - {:<10} {} : {}\n", outcomeTag(r.outcome), r.testCaseId,
                               r.message);
            for (const auto& c : r.topCandidates) {
                out << fmt::format("      #{} {} {} ({:.3f})\n", c.rank, c.documentId, c.label,
                                   c.score);
            }
        }
    }
    out << fmt::format("\nStatus: {}\n", report::runStatusName(summary.status()));
}

} // namespace relcheck::tools
