/**
 * @file cancellation.cpp
 * @brief Implementation of CancellationToken
 */

#include "geo_estimator/cancellation.hpp"
#include "geo_estimator/errors.hpp"
#include <algorithm>
#include <string>

namespace geo_estimator {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::sleepFor(std::chrono::steady_clock::duration duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

void CancellationToken::throwIfCancelled(const char* where) const {
    if (isCancelled()) {
        throw OperationCancelled(std::string(where) + " cancelled");
    }
}

std::chrono::milliseconds CancellationToken::capTimeout(std::chrono::milliseconds timeout) const {
    if (!deadline_) {
        return timeout;
    }
    auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return std::max(std::chrono::milliseconds(1), std::min(timeout, left));
}

} // namespace geo_estimator
