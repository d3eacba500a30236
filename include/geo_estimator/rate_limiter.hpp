/**
 * @file rate_limiter.hpp
 * @brief Per-key token bucket shared by all outbound calls
 */

#pragma once

#include "cancellation.hpp"
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace geo_estimator {

/**
 * @brief Token bucket keyed by provider
 *
 * Every key gets its own bucket of the same rate and capacity; a new key
 * starts full. Bookkeeping is serialized by one mutex that is never held
 * while a caller waits, so a starved key does not block the others.
 */
class TokenBucketRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param rate Refill rate (tokens per second, >= 0)
     * @param capacity Maximum tokens per key (> 0)
     */
    TokenBucketRateLimiter(double rate, double capacity);

    TokenBucketRateLimiter(const TokenBucketRateLimiter&) = delete;
    TokenBucketRateLimiter& operator=(const TokenBucketRateLimiter&) = delete;

    /**
     * @brief Block until @p tokens can be debited from @p key
     *
     * @throws InvalidTokenRequest if tokens > capacity or tokens <= 0 (never waits)
     * @throws OperationCancelled if @p cancel fires while waiting
     */
    void acquire(const std::string& key, double tokens = 1.0,
                 const CancellationToken* cancel = nullptr);

    /**
     * @brief Debit without waiting
     * @return true if the tokens were available
     */
    bool tryAcquire(const std::string& key, double tokens = 1.0);

    /**
     * @brief Tokens currently available for @p key (after refill, no debit)
     */
    double available(const std::string& key) const;

    double rate() const { return rate_; }
    double capacity() const { return capacity_; }

private:
    struct Bucket {
        double tokens;
        Clock::time_point last_refill;
    };

    void checkRequest(double tokens) const;

    /// Refill @p key and debit if possible; returns the wait needed otherwise.
    /// Caller must hold mutex_.
    Clock::duration refillAndTryDebit(const std::string& key, double tokens);

    double rate_;
    double capacity_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
};

} // namespace geo_estimator
