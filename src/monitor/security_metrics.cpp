#include "monitor/security_metrics.h"
#include <limits>
#include <stdexcept>
#include <string>

namespace chaosforge {

namespace {

constexpr uint64_t kAnomalyWeight = 10;
constexpr uint64_t kManipulationWeight = 20;

uint64_t checked_mul(uint64_t a, uint64_t b, const char* what) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        throw std::overflow_error(std::string(what) + " overflowed");
    }
    return a * b;
}

void checked_increment(std::atomic<uint64_t>& counter, uint64_t count, const char* what) {
    uint64_t current = counter.load(std::memory_order_relaxed);
    uint64_t next;
    do {
        next = checked_add(current, count, what);
    } while (!counter.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                            std::memory_order_relaxed));
}

}  // namespace

uint64_t checked_add(uint64_t a, uint64_t b, const char* what) {
    if (b > std::numeric_limits<uint64_t>::max() - a) {
        throw std::overflow_error(std::string(what) + " overflowed");
    }
    return a + b;
}

uint64_t SecuritySnapshot::total_manipulations() const {
    uint64_t total = checked_add(vote_manipulations, execution_manipulations,
                                 "total manipulations");
    return checked_add(total, state_manipulations, "total manipulations");
}

uint64_t SecuritySnapshot::total_exploits() const {
    uint64_t total = 0;
    for (const auto& [category, count] : exploit_attempts) {
        total = checked_add(total, count, "total exploit attempts");
    }
    return total;
}

uint64_t SecuritySnapshot::risk_score() const {
    return checked_add(checked_mul(anomalies, kAnomalyWeight, "risk score"),
                       checked_mul(total_manipulations(), kManipulationWeight, "risk score"),
                       "risk score");
}

std::optional<Severity> SecuritySnapshot::alert_level() const {
    uint64_t exploits = total_exploits();
    if (exploits > 100) return Severity::High;
    if (exploits > 50) return Severity::Medium;
    if (exploits > 10) return Severity::Low;
    return std::nullopt;
}

void SecurityMetrics::record_transaction(bool success) {
    checked_increment(total_transactions_, 1, "total transactions");
    if (!success) {
        checked_increment(failed_transactions_, 1, "failed transactions");
    }
}

void SecurityMetrics::record_manipulation(ManipulationKind kind, uint64_t count) {
    switch (kind) {
        case ManipulationKind::Vote:
            checked_increment(vote_manipulations_, count, "vote manipulations");
            break;
        case ManipulationKind::Execution:
            checked_increment(execution_manipulations_, count, "execution manipulations");
            break;
        case ManipulationKind::State:
            checked_increment(state_manipulations_, count, "state manipulations");
            break;
    }
}

void SecurityMetrics::record_exploit_attempt(const std::string& category, uint64_t count) {
    std::lock_guard lock(exploits_mutex_);
    uint64_t& slot = exploit_attempts_[category];
    slot = checked_add(slot, count, "exploit attempts");
}

void SecurityMetrics::record_anomaly() {
    checked_increment(anomalies_, 1, "anomalies");
}

SecuritySnapshot SecurityMetrics::snapshot() const {
    SecuritySnapshot snap;
    snap.total_transactions = total_transactions_.load(std::memory_order_acquire);
    snap.failed_transactions = failed_transactions_.load(std::memory_order_acquire);
    snap.vote_manipulations = vote_manipulations_.load(std::memory_order_acquire);
    snap.execution_manipulations = execution_manipulations_.load(std::memory_order_acquire);
    snap.state_manipulations = state_manipulations_.load(std::memory_order_acquire);
    snap.anomalies = anomalies_.load(std::memory_order_acquire);
    {
        std::lock_guard lock(exploits_mutex_);
        snap.exploit_attempts = exploit_attempts_;
    }
    return snap;
}

void SecurityMetrics::reset() {
    total_transactions_.store(0);
    failed_transactions_.store(0);
    vote_manipulations_.store(0);
    execution_manipulations_.store(0);
    state_manipulations_.store(0);
    anomalies_.store(0);
    std::lock_guard lock(exploits_mutex_);
    exploit_attempts_.clear();
}

const char* to_string(ManipulationKind kind) {
    switch (kind) {
        case ManipulationKind::Vote: return "vote";
        case ManipulationKind::Execution: return "execution";
        case ManipulationKind::State: return "state";
    }
    return "unknown";
}

}  // namespace chaosforge
