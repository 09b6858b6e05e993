#include <relcheck/validation/validation_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>

namespace relcheck::validation {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::string formatScore(double score) {
    return fmt::format("{:.3f}", score);
}

} // namespace

const char* outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Pass:
            return "pass";
        case Outcome::FailNotFound:
            return "fail_not_found";
        case Outcome::FailRankExceeded:
            return "fail_rank_exceeded";
        case Outcome::FailScoreBelowThreshold:
            return "fail_score_below_threshold";
        case Outcome::Error:
            return "error";
    }
    return "error";
}

std::optional<Outcome> parseOutcome(std::string_view name) {
    for (auto o : kAllOutcomes) {
        if (name == outcomeName(o))
            return o;
    }
    return std::nullopt;
}

Classification classifyCandidates(const registry::TestCase& testCase,
                                  const std::vector<search::SearchCandidate>& candidates,
                                  int maxAllowedRank, double minScoreThreshold) {
    Classification c;
    auto it = std::find_if(candidates.begin(), candidates.end(),
                           [&](const search::SearchCandidate& cand) {
                               return testCase.matches(cand.documentId);
                           });
    if (it == candidates.end()) {
        c.outcome = Outcome::FailNotFound;
        c.message = fmt::format("'{}' not found in top {}", testCase.expectedDocumentId,
                                candidates.size());
        return c;
    }

    c.rank = it->rank;
    c.score = it->score;
    c.matchedDocumentId = it->documentId;

    if (it->rank > maxAllowedRank) {
        c.outcome = Outcome::FailRankExceeded;
        c.message = fmt::format("'{}' found at rank {} (max allowed {})", it->documentId,
                                it->rank, maxAllowedRank);
    } else if (it->score < minScoreThreshold) {
        c.outcome = Outcome::FailScoreBelowThreshold;
        c.message = fmt::format("'{}' at rank {} scored {} (min {})", it->documentId, it->rank,
                                formatScore(it->score), formatScore(minScoreThreshold));
    } else {
        c.outcome = Outcome::Pass;
        c.message = fmt::format("'{}' found at rank {} with score {}", it->documentId, it->rank,
                                formatScore(it->score));
    }
    return c;
}

CaseResult makeCaseResult(const registry::TestCase& testCase) {
    CaseResult r;
    r.testCaseId = testCase.id;
    r.testName = testCase.displayName();
    r.category = testCase.category;
    r.queryText = testCase.queryText;
    r.expectedDocumentId = testCase.expectedDocumentId;
    return r;
}

CaseResult makeErrorResult(const registry::TestCase& testCase, std::string detail,
                           double durationMs) {
    CaseResult r = makeCaseResult(testCase);
    r.outcome = Outcome::Error;
    r.message = "error: " + detail;
    r.errorDetail = std::move(detail);
    r.durationMs = durationMs;
    return r;
}

ValidationEngine::ValidationEngine(ml::IEmbeddingProvider& embedder,
                                   search::ISearchBackend& backend, EngineSettings settings)
    : embedder_(embedder), backend_(backend), settings_(settings) {}

int ValidationEngine::effectiveMaxRank(const registry::TestCase& testCase) const {
    return testCase.maxAllowedRank.value_or(settings_.maxAllowedRank);
}

double ValidationEngine::effectiveMinScore(const registry::TestCase& testCase) const {
    return testCase.minScoreThreshold.value_or(settings_.minScoreThreshold);
}

int ValidationEngine::effectiveTopK(const registry::TestCase& testCase) const {
    return search::clampTopK(std::max(settings_.topK, effectiveMaxRank(testCase)));
}

Result<CaseResult> ValidationEngine::evaluate(const registry::TestCase& testCase,
                                              const CancellationToken& runToken) const {
    const auto start = Clock::now();
    const auto caseToken = runToken.withTimeout(settings_.testTimeout);

    // Turns a case-scoped failure into an Error outcome with the most specific detail.
    auto failed = [&](const Error& err, const char* stage) -> Result<CaseResult> {
        if (isFatal(err.code)) {
            return err;
        }
        std::string detail;
        if (runToken.isCancelled()) {
            detail = runToken.state() == CancellationToken::State::DeadlineExceeded
                         ? "run timeout exceeded"
                         : "run cancelled: " + runToken.reason();
        } else if (caseToken.ownDeadlineExceeded()) {
            detail = fmt::format("test timeout exceeded ({}s) during {}",
                                 std::chrono::duration_cast<std::chrono::seconds>(
                                     settings_.testTimeout)
                                     .count(),
                                 stage);
        } else {
            detail = fmt::format("{} failed: {}", stage, err.message);
        }
        spdlog::debug("[{}] {}", testCase.id, detail);
        return makeErrorResult(testCase, std::move(detail), elapsedMs(start));
    };

    auto embedding = embedder_.embed(testCase.queryText, caseToken);
    if (!embedding) {
        return failed(embedding.error(), "embedding");
    }

    const int topK = effectiveTopK(testCase);
    auto candidates = backend_.search(embedding.value(), topK, caseToken);
    if (!candidates) {
        return failed(candidates.error(), "search");
    }

    const auto& hits = candidates.value();
    const int maxRank = effectiveMaxRank(testCase);
    const double minScore = effectiveMinScore(testCase);
    auto cls = classifyCandidates(testCase, hits, maxRank, minScore);

    CaseResult r = makeCaseResult(testCase);
    r.outcome = cls.outcome;
    r.observedRank = cls.rank;
    r.observedScore = cls.score;
    r.matchedDocumentId = std::move(cls.matchedDocumentId);
    r.message = std::move(cls.message);
    r.topCandidates.assign(hits.begin(),
                           hits.begin() + static_cast<std::ptrdiff_t>(
                                              std::min(hits.size(), kTopCandidatesKept)));
    r.durationMs = elapsedMs(start);

    spdlog::debug("[{}] {} in {:.1f} ms: {}", testCase.id, outcomeName(r.outcome), r.durationMs,
                  r.message);
    return r;
}

} // namespace relcheck::validation
