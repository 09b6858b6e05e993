#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <relcheck/core/cancellation.h>
#include <relcheck/core/types.h>
#include <relcheck/ml/provider.h>
#include <relcheck/registry/test_case.h>
#include <relcheck/search/search_backend.h>
#include <relcheck/validation/case_result.h>

namespace relcheck::validation {

/// Run-wide defaults a test case may override.
struct EngineSettings {
    int maxAllowedRank = 3;
    double minScoreThreshold = 0.3;
    int topK = 10;
    std::chrono::milliseconds testTimeout{60000};
};

struct Classification {
    Outcome outcome = Outcome::FailNotFound;
    std::optional<int> rank;
    std::optional<double> score;
    std::optional<std::string> matchedDocumentId;
    std::string message;
};

/**
 * @brief Decide the outcome of a case from the backend's candidates.
 *
 * The first candidate matching the expected id (or an alternate) is the match.
 * Rank is checked before score: a match ranked past @p maxAllowedRank is
 * FailRankExceeded even when its score is also too low.
 */
Classification classifyCandidates(const registry::TestCase& testCase,
                                  const std::vector<search::SearchCandidate>& candidates,
                                  int maxAllowedRank, double minScoreThreshold);

/**
 * @brief Per-case pipeline: embed, search, classify.
 *
 * Shared by all workers; holds no per-case state.
 */
class ValidationEngine {
public:
    ValidationEngine(ml::IEmbeddingProvider& embedder, search::ISearchBackend& backend,
                     EngineSettings settings);

    /**
     * Evaluate one case under @p runToken plus the per-case timeout.
     * Case-scoped failures become an Error outcome; fatal errors (Unauthorized,
     * BackendUnavailable, DimensionMismatch) are returned as the error of the Result.
     */
    Result<CaseResult> evaluate(const registry::TestCase& testCase,
                                const CancellationToken& runToken) const;

    int effectiveMaxRank(const registry::TestCase& testCase) const;
    double effectiveMinScore(const registry::TestCase& testCase) const;

    /// max(topK, maxAllowedRank), clamped to the backend limits.
    int effectiveTopK(const registry::TestCase& testCase) const;

    const EngineSettings& settings() const { return settings_; }

private:
    ml::IEmbeddingProvider& embedder_;
    search::ISearchBackend& backend_;
    EngineSettings settings_;
};

/// Skeleton result for @p testCase carrying its identity fields.
CaseResult makeCaseResult(const registry::TestCase& testCase);

/// Error-outcome result used for failures and for cases that never ran.
CaseResult makeErrorResult(const registry::TestCase& testCase, std::string detail,
                           double durationMs = 0.0);

} // namespace relcheck::validation
