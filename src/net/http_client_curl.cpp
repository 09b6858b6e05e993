/*
 * http_client_curl.cpp
 *
 * libcurl easy-API transport used by the embedding providers and the search backend.
 * - Honors per-request timeout capped by the cancellation token's deadline.
 * - Aborts in-flight transfers from the progress callback once the token trips.
 * - Retry/backoff lives in sendWithRetry(); send() performs exactly one exchange.
 */

#include <relcheck/net/http_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <random>

namespace relcheck::net {

namespace {

constexpr long kMaxConnectTimeoutMs = 10000;
constexpr size_t kStatusExcerpt = 200;

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    return cancel->isCancelled() ? 1 : 0;
}

class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    ~CurlHandle() {
        if (curl_)
            curl_easy_cleanup(curl_);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return curl_; }
    explicit operator bool() const { return curl_ != nullptr; }

private:
    CURL* curl_;
};

class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() {
        if (list_)
            curl_slist_free_all(list_);
    }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) { list_ = curl_slist_append(list_, line.c_str()); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

Error makeCurlError(CURLcode code, const std::string& url) {
    std::string msg = url + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return Error{ErrorCode::Timeout, msg};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
            return Error{ErrorCode::ConnectionFailed, msg};
        default:
            return Error{ErrorCode::NetworkError, msg};
    }
}

void ensureCurlGlobalInit() {
    static std::once_flag curlInitFlag;
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

class CurlHttpClient final : public IHttpClient {
public:
    CurlHttpClient() { ensureCurlGlobalInit(); }

    Result<HttpResponse> send(const HttpRequest& request,
                              const CancellationToken& cancel) override {
        if (cancel.isCancelled()) {
            return cancellationError(cancel, request.url);
        }

        auto timeout = request.timeout;
        if (auto left = cancel.remaining()) {
            timeout = std::min(timeout, *left);
            if (timeout.count() <= 0)
                return cancellationError(cancel, request.url);
        }

        CurlHandle curl;
        if (!curl) {
            return Error{ErrorCode::InternalError, "Failed to initialize cURL"};
        }

        HttpResponse response;
        HeaderList headers;
        for (const auto& h : request.headers) {
            headers.append(h.name + ": " + h.value);
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                         std::min<long>(static_cast<long>(timeout.count()), kMaxConnectTimeoutMs));
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl.get(), CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &cancel);

        if (!request.proxy.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_PROXY, request.proxy.c_str());
        }

        if (request.method == "GET") {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc == CURLE_ABORTED_BY_CALLBACK) {
            return cancellationError(cancel, request.url);
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, request.url);
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        spdlog::trace("{} {} -> {}", request.method, request.url, response.status);
        return response;
    }
};

std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt) {
    double base = static_cast<double>(policy.initialBackoff.count());
    for (int i = 0; i < attempt; ++i)
        base *= policy.multiplier;
    auto delay = std::min<long long>(static_cast<long long>(base), policy.maxBackoff.count());
    if (policy.jitter.count() > 0) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<long long> dist(0, policy.jitter.count());
        delay += dist(rng);
    }
    return std::chrono::milliseconds(delay);
}

} // namespace

std::unique_ptr<IHttpClient> makeCurlHttpClient() {
    return std::make_unique<CurlHttpClient>();
}

bool isRetryable(const Error& error) {
    return error.code == ErrorCode::ConnectionFailed || error.code == ErrorCode::Timeout ||
           error.code == ErrorCode::NetworkError;
}

bool isRetryableStatus(long status) {
    return status == 429 || (status >= 500 && status <= 599);
}

Error cancellationError(const CancellationToken& cancel, const std::string& where) {
    if (cancel.state() == CancellationToken::State::DeadlineExceeded) {
        return Error{ErrorCode::Timeout, where + ": deadline exceeded"};
    }
    return Error{ErrorCode::OperationCancelled, where + ": " + cancel.reason()};
}

std::string describeStatus(const HttpResponse& response) {
    // Cut on a UTF-8 lead byte so the excerpt never ends inside a character.
    std::size_t cut = std::min(response.body.size(), kStatusExcerpt);
    while (cut > 0 && cut < response.body.size() &&
           (static_cast<unsigned char>(response.body[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string excerpt = response.body.substr(0, cut);
    for (auto& c : excerpt) {
        if (c == '\n' || c == '\r')
            c = ' ';
    }
    std::string out = "HTTP " + std::to_string(response.status);
    if (!excerpt.empty())
        out += ": " + excerpt;
    return out;
}

Result<HttpResponse> sendWithRetry(IHttpClient& client, const HttpRequest& request,
                                   const RetryPolicy& policy, const CancellationToken& cancel) {
    const int attempts = std::max(1, policy.maxAttempts);
    for (int attempt = 0;; ++attempt) {
        auto result = client.send(request, cancel);
        const bool last = attempt + 1 >= attempts || cancel.isCancelled();

        if (result) {
            const auto& resp = result.value();
            if (!isRetryableStatus(resp.status) || last)
                return result;
            spdlog::warn("{} {} returned {}, retrying ({}/{})", request.method, request.url,
                         resp.status, attempt + 1, attempts - 1);
        } else {
            if (!isRetryable(result.error()) || last)
                return result;
            spdlog::warn("{} {} failed: {}, retrying ({}/{})", request.method, request.url,
                         result.error().message, attempt + 1, attempts - 1);
        }

        if (!cancel.sleepFor(backoffDelay(policy, attempt))) {
            return cancellationError(cancel, request.url);
        }
    }
}

} // namespace relcheck::net
