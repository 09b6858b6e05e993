#pragma once

#include <memory>
#include <string>
#include <vector>
#include <relcheck/config/app_config.h>
#include <relcheck/net/http_client.h>
#include <relcheck/search/search_backend.h>

namespace relcheck::search {

/**
 * @brief Qdrant REST backend.
 *
 * - search:  POST /collections/{name}/points/search
 * - info:    GET  /collections/{name}
 * - health:  GET  /healthz
 *
 * Document ids come from the first payload field in BackendConfig::idFields that is
 * present, falling back to the point id.
 */
class QdrantBackend final : public ISearchBackend {
public:
    QdrantBackend(config::BackendConfig config, std::shared_ptr<net::IHttpClient> http,
                  net::RetryPolicy retry);

    Result<std::vector<SearchCandidate>> search(const Embedding& vector, int topK,
                                                const CancellationToken& cancel) override;

    Result<CollectionInfo> getCollectionInfo(const CancellationToken& cancel) override;

    Result<void> healthCheck(const CancellationToken& cancel) override;

    std::string name() const override;

    /// Build the search request body (exposed for tests).
    std::string buildSearchBody(const Embedding& vector, int topK) const;

    /// Turn a search response into ranked candidates (exposed for tests).
    Result<std::vector<SearchCandidate>> parseSearchResponse(const std::string& body) const;

    /// Parse a GET /collections/{name} response (exposed for tests).
    Result<CollectionInfo> parseCollectionInfo(const std::string& body) const;

private:
    net::HttpRequest makeRequest(const std::string& method, const std::string& path) const;
    Result<net::HttpResponse> perform(const net::HttpRequest& request,
                                      const CancellationToken& cancel) const;
    Result<net::HttpResponse> classify(const net::HttpRequest& request,
                                       Result<net::HttpResponse> resp) const;

    config::BackendConfig config_;
    std::shared_ptr<net::IHttpClient> http_;
    net::RetryPolicy retry_;
    std::string base_;
};

std::unique_ptr<ISearchBackend> makeQdrantBackend(const config::BackendConfig& config,
                                                  std::shared_ptr<net::IHttpClient> http,
                                                  const net::RetryPolicy& retry);

} // namespace relcheck::search
