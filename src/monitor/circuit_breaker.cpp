#include "monitor/circuit_breaker.h"
#include <spdlog/spdlog.h>

namespace chaosforge {

bool CircuitBreaker::trip(const std::string& reason) {
    BreakerState expected = BreakerState::Closed;
    if (!state_.compare_exchange_strong(expected, BreakerState::Open,
                                        std::memory_order_acq_rel)) {
        return false;
    }
    trips_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard lock(reason_mutex_);
        last_reason_ = reason;
    }
    spdlog::critical("Circuit breaker opened: {}", reason);
    return true;
}

bool CircuitBreaker::reset() {
    BreakerState expected = BreakerState::Open;
    if (!state_.compare_exchange_strong(expected, BreakerState::Closed,
                                        std::memory_order_acq_rel)) {
        return false;
    }
    spdlog::warn("Circuit breaker reset to closed");
    return true;
}

std::string CircuitBreaker::last_reason() const {
    std::lock_guard lock(reason_mutex_);
    return last_reason_;
}

const char* to_string(BreakerState state) {
    switch (state) {
        case BreakerState::Closed: return "closed";
        case BreakerState::Open: return "open";
    }
    return "unknown";
}

}  // namespace chaosforge
