#pragma once
#ifndef CHAOSFORGE_SECURITY_MONITOR_H
#define CHAOSFORGE_SECURITY_MONITOR_H

#include "core/context.h"
#include "core/types.h"
#include "monitor/rate_limiter.h"
#include "monitor/security_metrics.h"
#include <atomic>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <boost/asio.hpp>

namespace chaosforge {

enum class CycleStatus {
    Evaluated,  // counters checked, breaker left as it was
    Tripped,    // a trip condition held this cycle
};

struct CycleReport {
    CycleStatus status = CycleStatus::Evaluated;
    bool rate_limited = false;  // limiter refused this cycle's operation slot
    SecuritySnapshot snapshot;
    uint64_t total_manipulations = 0;
    uint64_t total_exploits = 0;
    bool breaker_open = false;
    std::optional<Severity> exploit_alert_level;
    std::optional<Alert> alert;  // set when this cycle opened the breaker
};

class SecurityMonitor {
public:
    explicit SecurityMonitor(ChaosContext& context);
    ~SecurityMonitor();

    SecurityMonitor(const SecurityMonitor&) = delete;
    SecurityMonitor& operator=(const SecurityMonitor&) = delete;

    // One monitoring cycle. The breaker is evaluated even when the limiter
    // refuses the cycle. Counter overflow propagates as std::overflow_error.
    CycleReport tick(SteadyTime now);

    // Runs tick() every monitor_interval on a dedicated thread. A fault stops
    // the loop and leaves the breaker open.
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    uint64_t cycles() const { return cycles_.load(); }
    bool faulted() const;
    // Rethrows the exception that stopped the loop, if any
    void rethrow_fault() const;

private:
    void schedule_next();
    void on_timer();

    ChaosContext& context_;
    SlidingWindowRateLimiter limiter_;

    boost::asio::io_context io_context_;
    boost::asio::steady_timer timer_;
    std::thread loop_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};

    mutable std::mutex fault_mutex_;
    std::exception_ptr fault_;
};

const char* to_string(CycleStatus status);

}  // namespace chaosforge

#endif  // CHAOSFORGE_SECURITY_MONITOR_H
