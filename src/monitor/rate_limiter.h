#pragma once
#ifndef CHAOSFORGE_RATE_LIMITER_H
#define CHAOSFORGE_RATE_LIMITER_H

#include "core/types.h"
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

namespace chaosforge {

// Admits at most max_operations within any window ending at `now`.
// Timestamps at least one window old are pruned before each decision.
class SlidingWindowRateLimiter {
public:
    SlidingWindowRateLimiter(std::chrono::seconds window, size_t max_operations);

    bool try_acquire(SteadyTime now);

    size_t in_window(SteadyTime now);
    std::chrono::seconds window() const { return window_; }
    size_t max_operations() const { return max_operations_; }
    void reset();

private:
    void prune(SteadyTime now);

    const std::chrono::seconds window_;
    const size_t max_operations_;
    std::mutex mutex_;
    std::deque<SteadyTime> timestamps_;
};

}  // namespace chaosforge

#endif  // CHAOSFORGE_RATE_LIMITER_H
