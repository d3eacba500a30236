/**
 * @file cancellation.hpp
 * @brief Shared cancellation scope for one pipeline request
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace geo_estimator {

/**
 * @brief Cancellation flag with interruptible sleeps
 *
 * One token is shared by every task of a request. cancel() wakes all
 * sleepers at once; it cannot be reset. An optional deadline tells
 * blocking calls how long they may still take; it does not fire the
 * token by itself.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(Clock::time_point deadline) : deadline_(deadline) {}
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief Sleep for @p duration unless cancelled first
     *
     * @return true if the full duration elapsed, false if cancelled
     */
    bool sleepFor(std::chrono::steady_clock::duration duration) const;

    /**
     * @brief Throw OperationCancelled if the token has fired
     */
    void throwIfCancelled(const char* where) const;

    const std::optional<Clock::time_point>& deadline() const { return deadline_; }

    /**
     * @brief Clamp a per-call timeout to the time left before the deadline
     *
     * Never returns less than 1 ms so a transfer is still attempted and
     * reports its own timeout.
     */
    std::chrono::milliseconds capTimeout(std::chrono::milliseconds timeout) const;

private:
    std::optional<Clock::time_point> deadline_;
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace geo_estimator
