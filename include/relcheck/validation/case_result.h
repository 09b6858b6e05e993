#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <relcheck/search/search_backend.h>

namespace relcheck::validation {

enum class Outcome { Pass, FailNotFound, FailRankExceeded, FailScoreBelowThreshold, Error };

inline constexpr Outcome kAllOutcomes[] = {Outcome::Pass, Outcome::FailNotFound,
                                           Outcome::FailRankExceeded,
                                           Outcome::FailScoreBelowThreshold, Outcome::Error};

/// Stable snake_case name used in reports ("pass", "fail_not_found", ...).
const char* outcomeName(Outcome outcome);

std::optional<Outcome> parseOutcome(std::string_view name);

/// Number of candidates kept on a result for report detail.
constexpr std::size_t kTopCandidatesKept = 5;

/**
 * Outcome of evaluating one test case. Created once by the engine (or by the
 * orchestrator for cases that never ran) and not modified afterwards.
 */
struct CaseResult {
    std::string testCaseId;
    std::string testName;
    std::optional<std::string> category;
    std::string queryText;
    std::string expectedDocumentId;
    Outcome outcome = Outcome::Error;
    std::optional<int> observedRank;
    std::optional<double> observedScore;
    std::optional<std::string> matchedDocumentId;
    std::string message;
    std::optional<std::string> errorDetail;
    double durationMs = 0.0;
    std::vector<search::SearchCandidate> topCandidates;

    bool passed() const { return outcome == Outcome::Pass; }
};

} // namespace relcheck::validation
