#include <relcheck/ml/provider.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <map>
#include <mutex>
#include <random>

namespace relcheck::ml {

// ============================================================================
// Hash Embedding Provider
// ============================================================================

/**
 * Offline provider for dry runs and tests.
 * Generates deterministic unit-length embeddings seeded from the text hash.
 */
class HashEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashEmbeddingProvider(size_t dimension) : dimension_(dimension) {
        spdlog::debug("HashEmbeddingProvider created with dimension {}", dimension);
    }

    Result<Embedding> embed(const std::string& text, const CancellationToken& cancel) override {
        if (text.empty()) {
            return Error{ErrorCode::InvalidArgument, "Cannot embed empty text"};
        }
        if (cancel.isCancelled()) {
            return net::cancellationError(cancel, "hash embedding");
        }

        std::hash<std::string> hasher;
        std::mt19937 gen(static_cast<std::mt19937::result_type>(hasher(text)));
        std::normal_distribution<float> dist(0.0f, 1.0f);

        Embedding embedding(dimension_);
        for (size_t i = 0; i < dimension_; ++i) {
            embedding[i] = dist(gen);
        }

        // Normalize to unit length
        float norm = 0.0f;
        for (float val : embedding) {
            norm += val * val;
        }
        norm = std::sqrt(norm);
        if (norm > 0) {
            for (float& val : embedding) {
                val /= norm;
            }
        }

        return embedding;
    }

    size_t dimension() const override { return dimension_; }

    std::string providerName() const override { return "hash"; }

    std::string modelName() const override {
        return "hash (" + std::to_string(dimension_) + "d)";
    }

private:
    size_t dimension_;
};

std::unique_ptr<IEmbeddingProvider> makeHashEmbeddingProvider(size_t dimension) {
    return std::make_unique<HashEmbeddingProvider>(dimension);
}

// ============================================================================
// Shared helpers
// ============================================================================

size_t knownDimension(const std::string& model) {
    static const std::map<std::string, size_t> kDims = {
        {"openai", 1536}, // text-embedding-3-small
        {"bgm-m3", 1024}, // BAAI general multilingual M3
        {"hash", 384},
    };
    auto it = kDims.find(model);
    return it == kDims.end() ? 0 : it->second;
}

Result<void> checkDimension(const Embedding& embedding, size_t expected,
                            const std::string& provider) {
    if (embedding.empty()) {
        return Error{ErrorCode::InvalidData, provider + " returned an empty embedding"};
    }
    if (expected != 0 && embedding.size() != expected) {
        return Error{ErrorCode::DimensionMismatch,
                     provider + " returned " + std::to_string(embedding.size()) +
                         " dimensions, expected " + std::to_string(expected)};
    }
    return Result<void>();
}

namespace {

bool isNumberArray(const nlohmann::json& j) {
    return j.is_array() && !j.empty() && j.front().is_number();
}

Result<Embedding> toEmbedding(const nlohmann::json& j) {
    Embedding out;
    out.reserve(j.size());
    for (const auto& v : j) {
        if (!v.is_number()) {
            return Error{ErrorCode::InvalidData, "Embedding contains a non-numeric value"};
        }
        out.push_back(v.get<float>());
    }
    return out;
}

// A list that is either one vector, a list of vectors, or a list of {"embedding": [...]}.
Result<std::vector<Embedding>> fromList(const nlohmann::json& list) {
    std::vector<Embedding> out;
    if (isNumberArray(list)) {
        auto e = toEmbedding(list);
        if (!e)
            return e.error();
        out.push_back(std::move(e).value());
        return out;
    }
    for (const auto& item : list) {
        const nlohmann::json* vec = &item;
        if (item.is_object()) {
            auto it = item.find("embedding");
            if (it == item.end()) {
                return Error{ErrorCode::InvalidData, "Embedding object without 'embedding'"};
            }
            vec = &*it;
        }
        if (!isNumberArray(*vec)) {
            return Error{ErrorCode::InvalidData, "Unexpected embedding entry shape"};
        }
        auto e = toEmbedding(*vec);
        if (!e)
            return e.error();
        out.push_back(std::move(e).value());
    }
    if (out.empty()) {
        return Error{ErrorCode::InvalidData, "Response contained no embeddings"};
    }
    return out;
}

} // namespace

Result<std::vector<Embedding>> parseEmbeddingResponse(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Invalid embedding JSON: ") + e.what()};
    }

    if (j.is_array()) {
        return fromList(j);
    }
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Embedding response is neither a list nor an object"};
    }

    for (const char* key : {"embeddings", "data", "vectors", "embedding"}) {
        auto it = j.find(key);
        if (it != j.end() && it->is_array() && !it->empty()) {
            return fromList(*it);
        }
    }
    for (const auto& [key, value] : j.items()) {
        if (value.is_array() && !value.empty()) {
            return fromList(value);
        }
    }
    return Error{ErrorCode::InvalidData, "No embeddings found in response"};
}

// ============================================================================
// Provider Factory Implementation
// ============================================================================

namespace {

std::mutex& registryMutex() {
    static std::mutex m;
    return m;
}

std::map<std::string, EmbeddingProviderFactory>& registry() {
    static std::map<std::string, EmbeddingProviderFactory> providers = {
        {"bgm-m3", [](const ProviderContext& ctx) { return makeHttpEmbeddingProvider(ctx); }},
        {"openai", [](const ProviderContext& ctx) { return makeOpenAiEmbeddingProvider(ctx); }},
        {"hash",
         [](const ProviderContext& ctx) {
             size_t dim = ctx.config.dimension ? ctx.config.dimension : knownDimension("hash");
             return makeHashEmbeddingProvider(dim);
         }},
    };
    return providers;
}

} // namespace

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory) {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry()[name] = std::move(factory);
    spdlog::debug("Registered embedding provider: {}", name);
}

std::vector<std::string> getRegisteredEmbeddingProviders() {
    std::lock_guard<std::mutex> lock(registryMutex());
    std::vector<std::string> names;
    for (const auto& [name, factory] : registry()) {
        names.push_back(name);
    }
    return names;
}

Result<std::unique_ptr<IEmbeddingProvider>> createEmbeddingProvider(const ProviderContext& ctx) {
    EmbeddingProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(registryMutex());
        auto it = registry().find(ctx.config.model);
        if (it != registry().end())
            factory = it->second;
    }
    if (!factory) {
        return Error{ErrorCode::ConfigurationError,
                     "Unsupported embedding model '" + ctx.config.model + "'"};
    }

    auto provider = factory(ctx);
    if (!provider) {
        return Error{ErrorCode::ConfigurationError,
                     "Embedding provider '" + ctx.config.model + "' could not be created"};
    }
    spdlog::info("Embedding provider: {} ({} dims)", provider->modelName(), provider->dimension());
    return Result<std::unique_ptr<IEmbeddingProvider>>(std::move(provider));
}

} // namespace relcheck::ml
