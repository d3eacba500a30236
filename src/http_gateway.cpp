/**
 * @file http_gateway.cpp
 * @brief Implementation of HttpGateway retry loop
 */

#include "geo_estimator/http_gateway.hpp"
#include "geo_estimator/errors.hpp"
#include <iostream>
#include <sstream>
#include <thread>

namespace geo_estimator {

AttemptResult classifyAttempt(HttpResponse response) {
    AttemptResult result;
    switch (response.error_kind) {
        case TransportError::NONE:
            if (response.isSuccess()) {
                result.outcome = AttemptOutcome::SUCCESS;
            } else {
                result.outcome = AttemptOutcome::RETRYABLE_FAILURE;
                result.cause = "HTTP status " + std::to_string(response.status_code);
            }
            break;
        case TransportError::TIMEOUT:
            result.outcome = AttemptOutcome::RETRYABLE_FAILURE;
            result.cause = "timeout: " + response.error;
            break;
        case TransportError::CONNECTION:
            result.outcome = AttemptOutcome::RETRYABLE_FAILURE;
            result.cause = "transport error: " + response.error;
            break;
        case TransportError::MALFORMED:
            result.outcome = AttemptOutcome::FATAL_FAILURE;
            result.cause = "malformed request: " + response.error;
            break;
        case TransportError::CANCELLED:
        default:
            result.outcome = AttemptOutcome::FATAL_FAILURE;
            result.cause = "cancelled";
            break;
    }
    result.response = std::move(response);
    return result;
}

RetryPolicy RetryPolicy::fromConfig(const Config& config) {
    RetryPolicy policy;
    policy.max_retries = config.max_http_retries;
    policy.backoff_base = std::chrono::milliseconds(
        static_cast<long long>(config.http_backoff_sec * 1000.0));
    policy.timeout = std::chrono::milliseconds(
        static_cast<long long>(config.http_timeout_sec * 1000.0));
    return policy;
}

HttpGateway::HttpGateway(HttpTransport& transport, TokenBucketRateLimiter& limiter,
                         RetryPolicy policy, bool verbose)
    : transport_(transport), limiter_(limiter), policy_(policy), verbose_(verbose) {
}

HttpResponse HttpGateway::get(const HttpRequest& request, const std::string& rate_key,
                              const CancellationToken* cancel) {
    std::string last_error = "no attempt made";

    for (int attempt = 0; ; ++attempt) {
        limiter_.acquire(rate_key, 1.0, cancel);

        auto timeout = cancel != nullptr ? cancel->capTimeout(policy_.timeout) : policy_.timeout;
        AttemptResult result = classifyAttempt(transport_.get(request, timeout, cancel));
        if (result.outcome == AttemptOutcome::SUCCESS) {
            return std::move(result.response);
        }
        if (result.response.error_kind == TransportError::CANCELLED ||
            (cancel != nullptr && cancel->isCancelled())) {
            throw OperationCancelled("request to '" + rate_key + "' cancelled");
        }

        last_error = result.cause;
        if (!policy_.shouldRetry(result, attempt)) {
            break;
        }

        auto delay = policy_.backoffFor(attempt);
        if (verbose_) {
            std::ostringstream line;
            line << "[HttpGateway] " << rate_key << " attempt " << (attempt + 1)
                 << " failed (" << last_error << "), retrying in " << delay.count() << " ms\n";
            std::cout << line.str();
        }
        if (cancel != nullptr) {
            if (!cancel->sleepFor(delay)) {
                throw OperationCancelled("request to '" + rate_key + "' cancelled");
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

    if (verbose_) {
        std::cout << "[HttpGateway] " + rate_key + " unavailable: " + last_error + "\n";
    }
    throw UpstreamUnavailable(rate_key, last_error);
}

} // namespace geo_estimator
