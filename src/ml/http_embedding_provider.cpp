#include <relcheck/ml/provider.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>

namespace relcheck::ml {

namespace {

using nlohmann::json;

constexpr const char* kDefaultServerUrl = "http://localhost:8000";
constexpr const char* kDefaultOpenAiUrl = "https://api.openai.com/v1";

net::HttpRequest jsonPost(const std::string& url, const json& body,
                          const config::EmbeddingConfig& cfg) {
    net::HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    req.timeout = cfg.timeout;
    req.proxy = cfg.proxy;
    req.headers.push_back({"Content-Type", "application/json"});
    req.headers.push_back({"Accept", "application/json"});
    return req;
}

// Any non-2xx from the embedding service is scoped to the case, 401/403 included.
Error statusError(const std::string& provider, const net::HttpResponse& resp) {
    return Error{ErrorCode::NetworkError, provider + ": " + net::describeStatus(resp)};
}

} // namespace

/**
 * Self-hosted embedding server (bgm-m3 style).
 *
 * Servers in the wild disagree on the request body, so the provider tries
 * {"inputs": [...]}, {"texts": [...]} and {"input": "..."} in that order and keeps
 * the first shape that produces a vector. The winning shape is remembered for the
 * rest of the process.
 */
class HttpEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HttpEmbeddingProvider(ProviderContext ctx) : ctx_(std::move(ctx)) {
        dimension_ = ctx_.config.dimension ? ctx_.config.dimension
                                           : knownDimension(ctx_.config.model);
        url_ = (ctx_.config.url.empty() ? kDefaultServerUrl : ctx_.config.url) +
               ctx_.config.endpoint;
    }

    Result<Embedding> embed(const std::string& text, const CancellationToken& cancel) override {
        if (text.empty()) {
            return Error{ErrorCode::InvalidArgument, "Cannot embed empty text"};
        }

        const int preferred = preferredShape_.load(std::memory_order_relaxed);
        Error lastError{ErrorCode::InvalidData, "No request shape accepted by " + url_};

        for (int i = 0; i < kShapeCount; ++i) {
            const int shape = (preferred + i) % kShapeCount;
            auto req = jsonPost(url_, buildBody(shape, text), ctx_.config);
            auto resp = net::sendWithRetry(*ctx_.http, req, ctx_.retry, cancel);
            if (!resp) {
                // Transport failures are not shape-related; trying another body won't help.
                return resp.error();
            }
            if (!resp.value().ok()) {
                lastError = statusError(providerName(), resp.value());
                spdlog::debug("{} rejected request shape {}: {}", url_, shape, lastError.message);
                continue;
            }

            auto parsed = parseEmbeddingResponse(resp.value().body);
            if (!parsed) {
                lastError = parsed.error();
                continue;
            }
            Embedding vec = std::move(parsed).value().front();
            if (auto ok = checkDimension(vec, dimension_, providerName()); !ok) {
                return ok.error();
            }
            preferredShape_.store(shape, std::memory_order_relaxed);
            return vec;
        }
        return lastError;
    }

    size_t dimension() const override { return dimension_; }

    std::string providerName() const override { return ctx_.config.model; }

    std::string modelName() const override { return ctx_.config.model + " (" + url_ + ")"; }

private:
    static constexpr int kShapeCount = 3;

    static json buildBody(int shape, const std::string& text) {
        switch (shape) {
            case 0:
                return json{{"inputs", json::array({text})}};
            case 1:
                return json{{"texts", json::array({text})}};
            default:
                return json{{"input", text}};
        }
    }

    ProviderContext ctx_;
    size_t dimension_ = 0;
    std::string url_;
    std::atomic<int> preferredShape_{0};
};

/**
 * OpenAI-compatible /embeddings endpoint.
 */
class OpenAiEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit OpenAiEmbeddingProvider(ProviderContext ctx) : ctx_(std::move(ctx)) {
        dimension_ = ctx_.config.dimension ? ctx_.config.dimension : knownDimension("openai");
        model_ = ctx_.config.modelName.empty() ? "text-embedding-3-small" : ctx_.config.modelName;
        base_ = ctx_.config.url.empty() ? kDefaultOpenAiUrl : ctx_.config.url;
    }

    Result<Embedding> embed(const std::string& text, const CancellationToken& cancel) override {
        if (text.empty()) {
            return Error{ErrorCode::InvalidArgument, "Cannot embed empty text"};
        }

        auto req = jsonPost(base_ + "/embeddings", json{{"model", model_}, {"input", text}},
                            ctx_.config);
        req.headers.push_back({"Authorization", "Bearer " + ctx_.config.apiKey});

        auto resp = net::sendWithRetry(*ctx_.http, req, ctx_.retry, cancel);
        if (!resp) {
            return resp.error();
        }
        if (!resp.value().ok()) {
            return statusError("openai", resp.value());
        }

        auto parsed = parseEmbeddingResponse(resp.value().body);
        if (!parsed) {
            return parsed.error();
        }
        Embedding vec = std::move(parsed).value().front();
        if (auto ok = checkDimension(vec, dimension_, "openai"); !ok) {
            return ok.error();
        }
        return vec;
    }

    size_t dimension() const override { return dimension_; }

    std::string providerName() const override { return "openai"; }

    std::string modelName() const override { return model_; }

private:
    ProviderContext ctx_;
    size_t dimension_ = 0;
    std::string model_;
    std::string base_;
};

std::unique_ptr<IEmbeddingProvider> makeHttpEmbeddingProvider(const ProviderContext& ctx) {
    return std::make_unique<HttpEmbeddingProvider>(ctx);
}

std::unique_ptr<IEmbeddingProvider> makeOpenAiEmbeddingProvider(const ProviderContext& ctx) {
    return std::make_unique<OpenAiEmbeddingProvider>(ctx);
}

} // namespace relcheck::ml
