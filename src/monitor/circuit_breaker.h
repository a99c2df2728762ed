#pragma once
#ifndef CHAOSFORGE_CIRCUIT_BREAKER_H
#define CHAOSFORGE_CIRCUIT_BREAKER_H

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace chaosforge {

enum class BreakerState { Closed, Open };

// Global stop switch. Workers read the state without locking; only the
// monitor trips it. Once open it stays open until reset() is called.
class CircuitBreaker {
public:
    CircuitBreaker() = default;

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Returns true only for the call that moved the breaker to Open
    bool trip(const std::string& reason);

    // Manual recovery; returns true if the breaker was open
    bool reset();

    BreakerState state() const { return state_.load(std::memory_order_acquire); }
    bool is_open() const { return state() == BreakerState::Open; }
    uint64_t trip_count() const { return trips_.load(std::memory_order_relaxed); }
    std::string last_reason() const;

private:
    std::atomic<BreakerState> state_{BreakerState::Closed};
    std::atomic<uint64_t> trips_{0};
    mutable std::mutex reason_mutex_;
    std::string last_reason_;
};

const char* to_string(BreakerState state);

}  // namespace chaosforge

#endif  // CHAOSFORGE_CIRCUIT_BREAKER_H
