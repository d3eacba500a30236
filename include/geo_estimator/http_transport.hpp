/**
 * @file http_transport.hpp
 * @brief Outbound HTTP transport interface and libcurl implementation
 */

#pragma once

#include "cancellation.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace geo_estimator {

/**
 * @brief Transport-level failure category
 */
enum class TransportError {
    NONE,        ///< Request completed (any HTTP status)
    TIMEOUT,     ///< Connect or transfer timed out
    CONNECTION,  ///< DNS, connect, TLS or read failure
    MALFORMED,   ///< Request could not be issued (bad URL, unsupported scheme)
    CANCELLED    ///< Aborted by the request's cancellation scope
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Outbound GET request
 */
struct HttpRequest {
    std::string url;   ///< Base URL without query string
    QueryParams params;
    std::unordered_map<std::string, std::string> headers;

    /**
     * @brief URL with percent-encoded query string appended
     */
    std::string fullUrl() const;
};

/**
 * @brief HTTP response or transport failure
 */
struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::unordered_map<std::string, std::string> headers;

    TransportError error_kind = TransportError::NONE;
    std::string error;  ///< Transport error text when error_kind != NONE

    bool isSuccess() const {
        return error_kind == TransportError::NONE && status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Percent-encode a query component (RFC 3986 unreserved kept)
 */
std::string urlEncode(const std::string& value);

/**
 * @brief Encode key=value pairs joined by '&'
 */
std::string encodeQuery(const QueryParams& params);

/**
 * @brief Format a number for a query string without trailing noise
 */
std::string formatNumber(double value);

/**
 * @brief Single-attempt HTTP transport
 *
 * Implementations never throw for network problems; they report them in
 * HttpResponse::error_kind so the gateway can decide on retries.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform one GET
     *
     * @param request Request to issue
     * @param timeout Connect + transfer timeout
     * @param cancel Optional scope; a fired token aborts the transfer
     */
    virtual HttpResponse get(
        const HttpRequest& request,
        std::chrono::milliseconds timeout,
        const CancellationToken* cancel
    ) = 0;
};

/**
 * @brief libcurl transport with a process-wide connection pool
 *
 * Connections, DNS and TLS sessions are shared between all requests
 * through one curl share handle; easy handles are pooled and reused.
 * Safe to call from several threads at once.
 */
class CurlHttpTransport : public HttpTransport {
public:
    explicit CurlHttpTransport(std::string user_agent = "GeoEstimator/1.0");
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse get(
        const HttpRequest& request,
        std::chrono::milliseconds timeout,
        const CancellationToken* cancel
    ) override;

private:
    struct Pool;  ///< curl share handle + idle easy handles

    std::string user_agent_;
    std::unique_ptr<Pool> pool_;
};

} // namespace geo_estimator
