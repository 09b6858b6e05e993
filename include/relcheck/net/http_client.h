#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <relcheck/core/cancellation.h>
#include <relcheck/core/types.h>

namespace relcheck::net {

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<Header> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
    std::string proxy;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Retry/backoff policy.
 */
struct RetryPolicy {
    int maxAttempts{4}; // total attempts including the first one
    std::chrono::milliseconds initialBackoff{200};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{5000};
    std::chrono::milliseconds jitter{50};
};

/**
 * @brief Minimal blocking HTTP transport.
 *
 * send() returns a response for every completed exchange, whatever its status;
 * only transport failures become errors:
 * - ConnectionFailed: DNS, refused or reset connections
 * - Timeout: the request timeout or the token's deadline elapsed
 * - OperationCancelled: the token was cancelled explicitly
 * - NetworkError: anything else on the wire
 * Implementations must be safe to call concurrently.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request,
                                      const CancellationToken& cancel) = 0;
};

/// libcurl-backed client; one easy handle per request.
std::unique_ptr<IHttpClient> makeCurlHttpClient();

/// Transport errors worth another attempt.
bool isRetryable(const Error& error);

/// Statuses worth another attempt (429 and 5xx).
bool isRetryableStatus(long status);

/**
 * @brief send() with bounded exponential backoff.
 *
 * Retries retryable transport errors and statuses until the policy is exhausted or
 * the token trips. The last response (even a 5xx) or the last error is returned.
 * Backoff sleeps are interrupted by cancellation.
 */
Result<HttpResponse> sendWithRetry(IHttpClient& client, const HttpRequest& request,
                                   const RetryPolicy& policy, const CancellationToken& cancel);

/// Error for a token that has tripped: Timeout for deadlines, OperationCancelled otherwise.
Error cancellationError(const CancellationToken& cancel, const std::string& where);

/// Short "HTTP <status>: <body excerpt>" description for logs and error details.
std::string describeStatus(const HttpResponse& response);

} // namespace relcheck::net
