/**
 * @file http_gateway.hpp
 * @brief Rate-limited, retrying wrapper for outbound GETs
 */

#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "rate_limiter.hpp"
#include <algorithm>
#include <chrono>
#include <string>

namespace geo_estimator {

/**
 * @brief Classification of a single attempt
 */
enum class AttemptOutcome {
    SUCCESS,            ///< 2xx response
    RETRYABLE_FAILURE,  ///< Timeout, transport error or non-2xx status
    FATAL_FAILURE       ///< Retrying cannot help (malformed request, cancelled)
};

/**
 * @brief Result of one attempt, inspected by the retry loop
 */
struct AttemptResult {
    AttemptOutcome outcome;
    HttpResponse response;
    std::string cause;  ///< Human-readable failure reason (empty on success)
};

/**
 * @brief Classify a transport response
 */
AttemptResult classifyAttempt(HttpResponse response);

/**
 * @brief Bounded retry with exponential backoff
 */
struct RetryPolicy {
    int max_retries = 2;                                   ///< Retries after the first attempt
    std::chrono::milliseconds backoff_base{500};           ///< Delay = base * 2^attempt
    std::chrono::milliseconds timeout{2500};               ///< Per-attempt timeout

    static RetryPolicy fromConfig(const Config& config);

    /**
     * @brief Whether another attempt should follow @p result
     *
     * @param attempt Zero-based index of the attempt that produced @p result
     */
    bool shouldRetry(const AttemptResult& result, int attempt) const {
        return result.outcome == AttemptOutcome::RETRYABLE_FAILURE && attempt < max_retries;
    }

    /**
     * @brief Backoff after attempt @p attempt; the exponent saturates at MAX_HTTP_RETRIES
     */
    std::chrono::milliseconds backoffFor(int attempt) const {
        int exponent = std::max(0, std::min(attempt, MAX_HTTP_RETRIES));
        return backoff_base * (1LL << exponent);
    }
};

/**
 * @brief Single retry point for all outbound traffic
 *
 * Every attempt, retries included, first acquires one token for the
 * caller's provider key. The limiter is never held across a backoff.
 * When the cancellation scope carries a deadline, each attempt's timeout
 * is cut to the time remaining.
 */
class HttpGateway {
public:
    HttpGateway(HttpTransport& transport, TokenBucketRateLimiter& limiter,
                RetryPolicy policy = RetryPolicy(), bool verbose = false);

    /**
     * @brief GET with rate limiting, timeout and retries
     *
     * @param request Request to issue
     * @param rate_key Provider key for the rate limiter
     * @param cancel Optional cancellation scope
     * @return The first 2xx response
     * @throws UpstreamUnavailable when retries are exhausted or the failure is fatal
     * @throws OperationCancelled when @p cancel fires
     */
    HttpResponse get(const HttpRequest& request, const std::string& rate_key,
                     const CancellationToken* cancel = nullptr);

    const RetryPolicy& policy() const { return policy_; }

private:
    HttpTransport& transport_;
    TokenBucketRateLimiter& limiter_;
    RetryPolicy policy_;
    bool verbose_;
};

} // namespace geo_estimator
