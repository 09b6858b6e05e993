#include <relcheck/search/qdrant_backend.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace relcheck::search {

using nlohmann::json;

namespace {

// Payload ids are strings in most collections but integers are common too.
std::string scalarToString(const json& v) {
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_number_integer())
        return std::to_string(v.get<long long>());
    if (v.is_number_unsigned())
        return std::to_string(v.get<unsigned long long>());
    if (v.is_number_float())
        return json(v).dump();
    return {};
}

std::string firstField(const json& payload, const std::vector<std::string>& fields) {
    if (!payload.is_object())
        return {};
    for (const auto& f : fields) {
        auto it = payload.find(f);
        if (it != payload.end() && !it->is_null()) {
            auto s = scalarToString(*it);
            if (!s.empty())
                return s;
        }
    }
    return {};
}

Result<json> parseBody(const std::string& body, const std::string& what) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, "Invalid " + what + " JSON: " + e.what()};
    }
}

} // namespace

QdrantBackend::QdrantBackend(config::BackendConfig config, std::shared_ptr<net::IHttpClient> http,
                             net::RetryPolicy retry)
    : config_(std::move(config)), http_(std::move(http)), retry_(retry),
      base_(config_.endpoint()) {}

std::string QdrantBackend::name() const {
    return "qdrant " + base_ + "/" + config_.collection;
}

net::HttpRequest QdrantBackend::makeRequest(const std::string& method,
                                            const std::string& path) const {
    net::HttpRequest req;
    req.method = method;
    req.url = base_ + path;
    req.timeout = config_.requestTimeout;
    req.headers.push_back({"Accept", "application/json"});
    if (method != "GET")
        req.headers.push_back({"Content-Type", "application/json"});
    if (!config_.apiKey.empty())
        req.headers.push_back({"api-key", config_.apiKey});
    return req;
}

Result<net::HttpResponse> QdrantBackend::perform(const net::HttpRequest& request,
                                                 const CancellationToken& cancel) const {
    return classify(request, net::sendWithRetry(*http_, request, retry_, cancel));
}

Result<net::HttpResponse> QdrantBackend::classify(const net::HttpRequest& request,
                                                  Result<net::HttpResponse> resp) const {
    if (!resp) {
        // Retries are exhausted at this point; an unreachable backend ends the run.
        if (resp.error().code == ErrorCode::ConnectionFailed) {
            return Error{ErrorCode::BackendUnavailable, resp.error().message};
        }
        return resp.error();
    }
    const auto& r = resp.value();
    if (r.status == 401 || r.status == 403) {
        return Error{ErrorCode::Unauthorized,
                     request.url + ": " + net::describeStatus(r) + " (check the api key)"};
    }
    if (!r.ok()) {
        return Error{ErrorCode::NetworkError, request.url + ": " + net::describeStatus(r)};
    }
    return resp;
}

std::string QdrantBackend::buildSearchBody(const Embedding& vector, int topK) const {
    json body;
    if (config_.vectorName.empty()) {
        body["vector"] = vector;
    } else {
        body["vector"] = json{{"name", config_.vectorName}, {"vector", vector}};
    }
    body["limit"] = clampTopK(topK);
    body["with_payload"] = true;
    return body.dump();
}

Result<std::vector<SearchCandidate>>
QdrantBackend::parseSearchResponse(const std::string& body) const {
    auto parsed = parseBody(body, "search response");
    if (!parsed)
        return parsed.error();
    const auto& j = parsed.value();

    auto it = j.find("result");
    if (it == j.end() || !it->is_array()) {
        return Error{ErrorCode::InvalidData, "Search response has no 'result' list"};
    }

    std::vector<SearchCandidate> out;
    out.reserve(it->size());
    try {
        int rank = 0;
        for (const auto& hit : *it) {
            if (!hit.is_object()) {
                return Error{ErrorCode::InvalidData, "Search hit is not an object"};
            }
            SearchCandidate c;
            c.rank = ++rank;
            c.score = hit.value("score", 0.0);

            const json payload = hit.contains("payload") ? hit["payload"] : json::object();
            c.documentId = firstField(payload, config_.idFields);
            if (c.documentId.empty() && hit.contains("id")) {
                c.documentId = scalarToString(hit["id"]);
            }
            c.label = firstField(payload, config_.labelFields);
            out.push_back(std::move(c));
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed search hit: ") + e.what()};
    }
    return out;
}

Result<CollectionInfo> QdrantBackend::parseCollectionInfo(const std::string& body) const {
    auto parsed = parseBody(body, "collection info");
    if (!parsed)
        return parsed.error();
    const auto& j = parsed.value();

    CollectionInfo info;
    try {
        const json result = j.value("result", json::object());
        info.status = result.value("status", std::string{});
        if (auto pc = result.find("points_count"); pc != result.end() && pc->is_number()) {
            info.pointCount = pc->get<std::uint64_t>();
        }

        json vectors;
        try {
            vectors = result.at("config").at("params").at("vectors");
        } catch (const json::exception&) {
            return Error{ErrorCode::InvalidData, "Collection info lacks config.params.vectors"};
        }

        // Unnamed: {"size": N, "distance": "Cosine"}; named: {"dense": {"size": ...}, ...}
        const json* params = nullptr;
        if (vectors.contains("size")) {
            params = &vectors;
        } else if (!config_.vectorName.empty()) {
            auto nv = vectors.find(config_.vectorName);
            if (nv == vectors.end()) {
                return Error{ErrorCode::ConfigurationError,
                             "Collection has no named vector '" + config_.vectorName + "'"};
            }
            params = &*nv;
        } else if (vectors.is_object() && !vectors.empty()) {
            params = &vectors.begin().value();
        }
        if (!params || !params->is_object() || !params->contains("size")) {
            return Error{ErrorCode::InvalidData, "Collection vector parameters not understood"};
        }
        info.vectorSize = params->at("size").get<std::size_t>();
        info.distance = params->value("distance", std::string{});
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed collection info: ") + e.what()};
    }
    return info;
}

Result<std::vector<SearchCandidate>> QdrantBackend::search(const Embedding& vector, int topK,
                                                           const CancellationToken& cancel) {
    auto req = makeRequest("POST", "/collections/" + config_.collection + "/points/search");
    req.body = buildSearchBody(vector, topK);

    auto resp = perform(req, cancel);
    if (!resp)
        return resp.error();
    auto candidates = parseSearchResponse(resp.value().body);
    if (candidates) {
        spdlog::debug("qdrant search limit={} returned {} hits", clampTopK(topK),
                      candidates.value().size());
    }
    return candidates;
}

Result<CollectionInfo> QdrantBackend::getCollectionInfo(const CancellationToken& cancel) {
    auto req = makeRequest("GET", "/collections/" + config_.collection);
    auto resp = net::sendWithRetry(*http_, req, retry_, cancel);
    if (resp && resp.value().status == 404) {
        return Error{ErrorCode::ConfigurationError,
                     "Collection '" + config_.collection + "' does not exist at " + base_};
    }
    auto checked = classify(req, std::move(resp));
    if (!checked)
        return checked.error();
    return parseCollectionInfo(checked.value().body);
}

Result<void> QdrantBackend::healthCheck(const CancellationToken& cancel) {
    auto resp = perform(makeRequest("GET", "/healthz"), cancel);
    if (!resp) {
        if (resp.error().code == ErrorCode::Unauthorized)
            return resp.error();
        return Error{ErrorCode::BackendUnavailable,
                     "Health check failed: " + resp.error().message};
    }
    spdlog::debug("qdrant at {} is healthy", base_);
    return Result<void>();
}

std::unique_ptr<ISearchBackend> makeQdrantBackend(const config::BackendConfig& config,
                                                  std::shared_ptr<net::IHttpClient> http,
                                                  const net::RetryPolicy& retry) {
    return std::make_unique<QdrantBackend>(config, std::move(http), retry);
}

} // namespace relcheck::search
