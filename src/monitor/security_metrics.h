#pragma once
#ifndef CHAOSFORGE_SECURITY_METRICS_H
#define CHAOSFORGE_SECURITY_METRICS_H

#include "core/types.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace chaosforge {

enum class ManipulationKind { Vote, Execution, State };

// Point-in-time copy of the running counters
struct SecuritySnapshot {
    uint64_t total_transactions = 0;
    uint64_t failed_transactions = 0;
    uint64_t vote_manipulations = 0;
    uint64_t execution_manipulations = 0;
    uint64_t state_manipulations = 0;
    uint64_t anomalies = 0;
    std::map<std::string, uint64_t> exploit_attempts;

    // The aggregations below throw std::overflow_error instead of wrapping
    uint64_t total_manipulations() const;
    uint64_t total_exploits() const;
    uint64_t risk_score() const;

    // >100 exploits High, >50 Medium, >10 Low
    std::optional<Severity> alert_level() const;
};

// Counters fed by engine workers and read by the monitor cycle
class SecurityMetrics {
public:
    SecurityMetrics() = default;

    SecurityMetrics(const SecurityMetrics&) = delete;
    SecurityMetrics& operator=(const SecurityMetrics&) = delete;

    void record_transaction(bool success);
    void record_manipulation(ManipulationKind kind, uint64_t count = 1);
    void record_exploit_attempt(const std::string& category, uint64_t count = 1);
    void record_anomaly();

    SecuritySnapshot snapshot() const;
    void reset();

private:
    std::atomic<uint64_t> total_transactions_{0};
    std::atomic<uint64_t> failed_transactions_{0};
    std::atomic<uint64_t> vote_manipulations_{0};
    std::atomic<uint64_t> execution_manipulations_{0};
    std::atomic<uint64_t> state_manipulations_{0};
    std::atomic<uint64_t> anomalies_{0};

    mutable std::mutex exploits_mutex_;
    std::map<std::string, uint64_t> exploit_attempts_;
};

uint64_t checked_add(uint64_t a, uint64_t b, const char* what);

const char* to_string(ManipulationKind kind);

}  // namespace chaosforge

#endif  // CHAOSFORGE_SECURITY_METRICS_H
