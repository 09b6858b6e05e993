#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <relcheck/ml/provider.h>

#include "../../common/fakes.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>

using namespace relcheck;
using namespace relcheck::ml;
using relcheck::test::FakeHttpClient;

namespace {

net::RetryPolicy fastRetry(int attempts = 1) {
    net::RetryPolicy p;
    p.maxAttempts = attempts;
    p.initialBackoff = std::chrono::milliseconds(1);
    p.maxBackoff = std::chrono::milliseconds(2);
    p.jitter = std::chrono::milliseconds(0);
    return p;
}

ProviderContext contextFor(const std::string& model, std::shared_ptr<FakeHttpClient> http,
                           std::size_t dimension = 3) {
    ProviderContext ctx;
    ctx.config.model = model;
    ctx.config.dimension = dimension;
    ctx.http = std::move(http);
    ctx.retry = fastRetry();
    return ctx;
}

} // namespace

TEST_CASE("parseEmbeddingResponse understands common server shapes", "[ml][parse]") {
    const char* bodies[] = {
        "[[0.1, 0.2, 0.3]]",
        "[0.1, 0.2, 0.3]",
        R"({"embeddings": [[0.1, 0.2, 0.3]]})",
        R"({"data": [{"embedding": [0.1, 0.2, 0.3], "index": 0}]})",
        R"({"vectors": [[0.1, 0.2, 0.3]]})",
        R"({"embedding": [0.1, 0.2, 0.3]})",
        R"({"model": "m3", "result": [[0.1, 0.2, 0.3]]})",
    };
    for (const char* body : bodies) {
        INFO(body);
        auto parsed = parseEmbeddingResponse(body);
        REQUIRE(parsed);
        REQUIRE(parsed.value().size() == 1);
        CHECK(parsed.value()[0].size() == 3);
        CHECK(parsed.value()[0][1] == Catch::Approx(0.2));
    }
}

TEST_CASE("parseEmbeddingResponse rejects unusable bodies", "[ml][parse]") {
    for (const char* body : {"not json", "{}", R"({"embeddings": [["a", "b"]]})", "42"}) {
        INFO(body);
        auto parsed = parseEmbeddingResponse(body);
        REQUIRE_FALSE(parsed);
        CHECK(parsed.error().code == ErrorCode::InvalidData);
    }
}

TEST_CASE("checkDimension", "[ml]") {
    CHECK(checkDimension({1.0f, 2.0f}, 2, "p"));
    CHECK(checkDimension({1.0f, 2.0f}, 0, "p"));
    CHECK(checkDimension({}, 2, "p").error().code == ErrorCode::InvalidData);
    CHECK(checkDimension({1.0f}, 2, "p").error().code == ErrorCode::DimensionMismatch);
}

TEST_CASE("hash provider is deterministic and normalized", "[ml][hash]") {
    auto provider = makeHashEmbeddingProvider(16);
    CancellationToken token;

    auto a = provider->embed("pasta carbonara", token);
    auto b = provider->embed("pasta carbonara", token);
    auto c = provider->embed("miso soup", token);
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(c);
    CHECK(a.value() == b.value());
    CHECK(a.value() != c.value());
    CHECK(a.value().size() == 16);

    double norm = 0.0;
    for (float v : a.value())
        norm += static_cast<double>(v) * v;
    CHECK(std::sqrt(norm) == Catch::Approx(1.0).epsilon(1e-4));

    CHECK(provider->embed("", token).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("factory resolves registered models", "[ml][factory]") {
    auto names = getRegisteredEmbeddingProviders();
    CHECK(std::find(names.begin(), names.end(), "bgm-m3") != names.end());
    CHECK(std::find(names.begin(), names.end(), "openai") != names.end());

    ProviderContext ctx;
    ctx.config.model = "hash";
    auto hash = createEmbeddingProvider(ctx);
    REQUIRE(hash);
    CHECK(hash.value()->dimension() == knownDimension("hash"));

    ctx.config.model = "word2vec";
    auto unknown = createEmbeddingProvider(ctx);
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == ErrorCode::ConfigurationError);
}

TEST_CASE("HTTP provider falls back across request shapes", "[ml][http]") {
    auto http = std::make_shared<FakeHttpClient>();
    http->onRequest([](const net::HttpRequest& req) -> Result<net::HttpResponse> {
        auto body = nlohmann::json::parse(req.body);
        net::HttpResponse resp;
        if (body.contains("texts")) {
            resp.status = 200;
            resp.body = R"({"embeddings": [[0.5, 0.25, 0.125]]})";
        } else {
            resp.status = 422;
            resp.body = "unprocessable";
        }
        return resp;
    });

    auto ctx = contextFor("bgm-m3", http);
    ctx.config.url = "http://embed:8000";
    auto provider = makeHttpEmbeddingProvider(ctx);

    auto first = provider->embed("pasta", CancellationToken());
    REQUIRE(first);
    CHECK(first.value() == Embedding{0.5f, 0.25f, 0.125f});
    REQUIRE(http->requests().size() == 2);
    CHECK(http->requests()[0].url == "http://embed:8000/embed");
    CHECK(http->requests()[0].method == "POST");

    // The accepted shape is tried first from now on
    auto second = provider->embed("soup", CancellationToken());
    REQUIRE(second);
    CHECK(http->requests().size() == 3);
}

TEST_CASE("HTTP provider errors", "[ml][http]") {
    auto http = std::make_shared<FakeHttpClient>();

    SECTION("all shapes rejected") {
        for (int i = 0; i < 3; ++i)
            http->reply(500, "boom");
        auto provider = makeHttpEmbeddingProvider(contextFor("bgm-m3", http));
        auto r = provider->embed("q", CancellationToken());
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NetworkError);
        CHECK(r.error().message.find("HTTP 500") != std::string::npos);
    }

    SECTION("unauthorized stays scoped to the case") {
        for (int i = 0; i < 3; ++i)
            http->reply(401, "no");
        auto provider = makeHttpEmbeddingProvider(contextFor("bgm-m3", http));
        auto r = provider->embed("q", CancellationToken());
        REQUIRE_FALSE(r);
        CHECK_FALSE(isFatal(r.error().code));
    }

    SECTION("transport failure is returned without trying other shapes") {
        http->replyError(Error{ErrorCode::ConnectionFailed, "refused"});
        auto provider = makeHttpEmbeddingProvider(contextFor("bgm-m3", http));
        auto r = provider->embed("q", CancellationToken());
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ConnectionFailed);
        CHECK(http->requests().size() == 1);
    }

    SECTION("wrong vector length") {
        http->reply(200, "[[1.0, 2.0]]");
        auto provider = makeHttpEmbeddingProvider(contextFor("bgm-m3", http, 3));
        auto r = provider->embed("q", CancellationToken());
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::DimensionMismatch);
    }
}

TEST_CASE("OpenAI provider sends model, input and bearer token", "[ml][openai]") {
    auto http = std::make_shared<FakeHttpClient>();
    http->reply(200, R"({"data": [{"embedding": [0.1, 0.2, 0.3]}]})");

    auto ctx = contextFor("openai", http);
    ctx.config.apiKey = "sk-test";
    auto provider = makeOpenAiEmbeddingProvider(ctx);

    auto r = provider->embed("pasta", CancellationToken());
    REQUIRE(r);

    const auto req = http->requests().at(0);
    CHECK(req.url == "https://api.openai.com/v1/embeddings");
    auto body = nlohmann::json::parse(req.body);
    CHECK(body["model"] == "text-embedding-3-small");
    CHECK(body["input"] == "pasta");
    bool bearer = false;
    for (const auto& h : req.headers)
        bearer = bearer || (h.name == "Authorization" && h.value == "Bearer sk-test");
    CHECK(bearer);
}

TEST_CASE("sendWithRetry retries 5xx and transport errors", "[net][retry]") {
    FakeHttpClient http;
    http.replyError(Error{ErrorCode::ConnectionFailed, "refused"});
    http.reply(503, "busy");
    http.reply(200, "ok");

    net::HttpRequest req;
    req.url = "http://x";
    auto r = net::sendWithRetry(http, req, fastRetry(4), CancellationToken());
    REQUIRE(r);
    CHECK(r.value().status == 200);
    CHECK(http.requests().size() == 3);
}

TEST_CASE("sendWithRetry does not retry client errors", "[net][retry]") {
    FakeHttpClient http;
    http.reply(404, "missing");
    http.reply(200, "ok");

    net::HttpRequest req;
    auto r = net::sendWithRetry(http, req, fastRetry(4), CancellationToken());
    REQUIRE(r);
    CHECK(r.value().status == 404);
    CHECK(http.requests().size() == 1);
}

TEST_CASE("sendWithRetry returns the last response when attempts run out", "[net][retry]") {
    FakeHttpClient http;
    http.reply(500, "a");
    http.reply(500, "b");

    net::HttpRequest req;
    auto r = net::sendWithRetry(http, req, fastRetry(2), CancellationToken());
    REQUIRE(r);
    CHECK(r.value().status == 500);
    CHECK(net::describeStatus(r.value()) == "HTTP 500: b");
}
