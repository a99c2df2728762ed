#include "monitor/rate_limiter.h"

namespace chaosforge {

SlidingWindowRateLimiter::SlidingWindowRateLimiter(std::chrono::seconds window,
                                                   size_t max_operations)
    : window_(window), max_operations_(max_operations) {}

void SlidingWindowRateLimiter::prune(SteadyTime now) {
    while (!timestamps_.empty() && now - timestamps_.front() >= window_) {
        timestamps_.pop_front();
    }
}

bool SlidingWindowRateLimiter::try_acquire(SteadyTime now) {
    std::lock_guard lock(mutex_);
    prune(now);
    if (timestamps_.size() >= max_operations_) {
        return false;
    }
    timestamps_.push_back(now);
    return true;
}

size_t SlidingWindowRateLimiter::in_window(SteadyTime now) {
    std::lock_guard lock(mutex_);
    prune(now);
    return timestamps_.size();
}

void SlidingWindowRateLimiter::reset() {
    std::lock_guard lock(mutex_);
    timestamps_.clear();
}

}  // namespace chaosforge
