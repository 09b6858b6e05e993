#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <relcheck/core/cancellation.h>
#include <relcheck/core/types.h>

namespace relcheck::search {

/**
 * One ranked hit returned by the backend. Rank is 1-based and follows the order
 * in which the backend returned the hits.
 */
struct SearchCandidate {
    std::string documentId;
    double score = 0.0;
    int rank = 0;
    std::string label;
};

struct CollectionInfo {
    std::size_t vectorSize = 0;
    std::string distance;
    std::uint64_t pointCount = 0;
    std::string status;
};

constexpr int kMinTopK = 1;
constexpr int kMaxTopK = 1000;

/// Clamp a requested result count into [kMinTopK, kMaxTopK].
constexpr int clampTopK(int topK) {
    return topK < kMinTopK ? kMinTopK : (topK > kMaxTopK ? kMaxTopK : topK);
}

/**
 * @brief Nearest-neighbor search service seen as an opaque query endpoint.
 *
 * Implementations are shared by every worker of a run and must be safe to call
 * concurrently. Errors follow the run's classification: Unauthorized and
 * BackendUnavailable are fatal, everything else is scoped to the calling case.
 */
class ISearchBackend {
public:
    virtual ~ISearchBackend() = default;

    /**
     * Query the index.
     * @param vector Query embedding
     * @param topK Number of hits requested (clamped by the implementation)
     * @param cancel Deadline/cancellation signal
     * @return candidates best first, ranks 1..n
     */
    virtual Result<std::vector<SearchCandidate>> search(const Embedding& vector, int topK,
                                                        const CancellationToken& cancel) = 0;

    virtual Result<CollectionInfo> getCollectionInfo(const CancellationToken& cancel) = 0;

    virtual Result<void> healthCheck(const CancellationToken& cancel) = 0;

    /// Backend identifier used in logs and reports.
    virtual std::string name() const = 0;
};

} // namespace relcheck::search
