#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <relcheck/config/app_config.h>
#include <relcheck/core/cancellation.h>
#include <relcheck/core/types.h>
#include <relcheck/net/http_client.h>

namespace relcheck::ml {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 * Turns query text into a fixed-length vector so the validation engine does not
 * depend on any one model or service.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate the embedding for a single text
     * @param text Query text, must be non-empty
     * @param cancel Deadline/cancellation signal for any network call
     * @return Vector of exactly dimension() floats, or
     *         InvalidArgument (empty text), DimensionMismatch (wrong length),
     *         Timeout/OperationCancelled/NetworkError/ConnectionFailed/InvalidData
     */
    virtual Result<Embedding> embed(const std::string& text, const CancellationToken& cancel) = 0;

    /**
     * Embedding dimension D every returned vector has
     */
    virtual size_t dimension() const = 0;

    /**
     * Provider identifier (e.g., "bgm-m3", "openai", "hash")
     */
    virtual std::string providerName() const = 0;

    /**
     * Human-readable model description for logs and reports
     */
    virtual std::string modelName() const = 0;
};

// ============================================================================
// Embedding Provider Factory
// ============================================================================

/**
 * Everything a provider needs at construction time.
 */
struct ProviderContext {
    config::EmbeddingConfig config;
    std::shared_ptr<net::IHttpClient> http;
    net::RetryPolicy retry;
};

using EmbeddingProviderFactory =
    std::function<std::unique_ptr<IEmbeddingProvider>(const ProviderContext&)>;

/**
 * Create the provider registered under config.model.
 * Built-in ids: "bgm-m3", "openai", "hash".
 * @return provider or ConfigurationError for an unknown id
 */
Result<std::unique_ptr<IEmbeddingProvider>> createEmbeddingProvider(const ProviderContext& ctx);

/**
 * Register an embedding provider factory (replaces an existing one of the same name)
 */
void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory);

/**
 * Names of all registered providers, sorted
 */
std::vector<std::string> getRegisteredEmbeddingProviders();

/**
 * Known default dimension of a model id, 0 when unknown
 */
size_t knownDimension(const std::string& model);

/**
 * Validate a provider result: non-empty and exactly @p expected long.
 */
Result<void> checkDimension(const Embedding& embedding, size_t expected,
                            const std::string& provider);

// Built-in providers (exposed for tests and direct wiring)
std::unique_ptr<IEmbeddingProvider> makeHttpEmbeddingProvider(const ProviderContext& ctx);
std::unique_ptr<IEmbeddingProvider> makeOpenAiEmbeddingProvider(const ProviderContext& ctx);
std::unique_ptr<IEmbeddingProvider> makeHashEmbeddingProvider(size_t dimension);

/**
 * Extract embeddings from the response shapes self-hosted servers return:
 * [[...], ...], [...], {"embeddings"|"data"|"vectors"|"embedding": ...},
 * {"data": [{"embedding": [...]}]} or the first list-valued member.
 */
Result<std::vector<Embedding>> parseEmbeddingResponse(const std::string& body);

} // namespace relcheck::ml
