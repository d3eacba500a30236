/**
 * @file rate_limiter.cpp
 * @brief Implementation of TokenBucketRateLimiter
 */

#include "geo_estimator/rate_limiter.hpp"
#include "geo_estimator/errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace geo_estimator {

namespace {
// Poll interval when the bucket never refills (rate == 0)
constexpr std::chrono::seconds ZERO_RATE_WAIT{1};
}

TokenBucketRateLimiter::TokenBucketRateLimiter(double rate, double capacity)
    : rate_(rate), capacity_(capacity) {
    if (rate < 0.0) {
        throw std::invalid_argument("rate must be >= 0");
    }
    if (capacity <= 0.0) {
        throw std::invalid_argument("capacity must be > 0");
    }
}

void TokenBucketRateLimiter::checkRequest(double tokens) const {
    if (tokens > capacity_) {
        throw InvalidTokenRequest("requested " + std::to_string(tokens) +
                                  " tokens exceeds bucket capacity " + std::to_string(capacity_));
    }
    if (!(tokens > 0.0)) {
        throw InvalidTokenRequest("token request must be positive");
    }
}

TokenBucketRateLimiter::Clock::duration TokenBucketRateLimiter::refillAndTryDebit(
    const std::string& key,
    double tokens
) {
    auto now = Clock::now();
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, Bucket{capacity_, now}).first;
    }
    Bucket& bucket = it->second;

    double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
    bucket.tokens = std::min(capacity_, bucket.tokens + elapsed * rate_);
    bucket.last_refill = now;

    if (bucket.tokens >= tokens) {
        bucket.tokens -= tokens;
        return Clock::duration::zero();
    }

    if (rate_ <= 0.0) {
        return std::chrono::duration_cast<Clock::duration>(ZERO_RATE_WAIT);
    }
    auto wait = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>((tokens - bucket.tokens) / rate_));
    return std::max(wait, Clock::duration(1));
}

void TokenBucketRateLimiter::acquire(
    const std::string& key,
    double tokens,
    const CancellationToken* cancel
) {
    checkRequest(tokens);

    while (true) {
        if (cancel) {
            cancel->throwIfCancelled("rate limiter wait");
        }

        Clock::duration wait;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            wait = refillAndTryDebit(key, tokens);
        }
        if (wait == Clock::duration::zero()) {
            return;
        }

        // Re-check after the sleep; another caller may have taken the refill
        if (cancel) {
            if (!cancel->sleepFor(wait)) {
                cancel->throwIfCancelled("rate limiter wait");
            }
        } else {
            std::this_thread::sleep_for(wait);
        }
    }
}

bool TokenBucketRateLimiter::tryAcquire(const std::string& key, double tokens) {
    checkRequest(tokens);
    std::lock_guard<std::mutex> lock(mutex_);
    return refillAndTryDebit(key, tokens) == Clock::duration::zero();
}

double TokenBucketRateLimiter::available(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return capacity_;
    }
    double elapsed = std::chrono::duration<double>(Clock::now() - it->second.last_refill).count();
    return std::min(capacity_, it->second.tokens + elapsed * rate_);
}

} // namespace geo_estimator
