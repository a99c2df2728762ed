#include "monitor/security_monitor.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>

namespace chaosforge {

SecurityMonitor::SecurityMonitor(ChaosContext& context)
    : context_(context),
      limiter_(context.config.rate_limit_window, context.config.max_operations_per_window),
      timer_(io_context_) {}

SecurityMonitor::~SecurityMonitor() {
    stop();
}

CycleReport SecurityMonitor::tick(SteadyTime now) {
    CycleReport report;
    cycles_.fetch_add(1);

    if (!limiter_.try_acquire(now)) {
        report.rate_limited = true;
        spdlog::debug("Monitor cycle rate limited ({} ops in window)", limiter_.max_operations());
    }

    report.snapshot = context_.metrics.snapshot();
    const auto& snap = report.snapshot;
    report.total_manipulations = snap.total_manipulations();
    report.total_exploits = snap.total_exploits();
    report.exploit_alert_level = snap.alert_level();

    const uint64_t threshold = context_.config.circuit_breaker_threshold;
    std::string reason;
    if (report.total_manipulations > threshold) {
        reason = fmt::format("{} manipulations exceed threshold {}",
                             report.total_manipulations, threshold);
    } else if (report.total_exploits > threshold) {
        reason = fmt::format("{} exploit attempts exceed threshold {}",
                             report.total_exploits, threshold);
    } else if (snap.failed_transactions > snap.total_transactions / 2) {
        reason = fmt::format("{} of {} transactions failed",
                             snap.failed_transactions, snap.total_transactions);
    }

    if (!reason.empty()) {
        report.status = CycleStatus::Tripped;
        if (context_.breaker.trip(reason)) {
            Alert alert{Severity::Critical, "Circuit breaker triggered: " + reason,
                        WallClock::now()};
            context_.events.record(alert);
            report.alert = std::move(alert);
        }
    }

    report.breaker_open = context_.breaker.is_open();
    spdlog::debug("Monitor cycle {}{}: tx={} failed={} manipulations={} exploits={} breaker={}",
                  to_string(report.status), report.rate_limited ? " (rate limited)" : "",
                  snap.total_transactions, snap.failed_transactions,
                  report.total_manipulations, report.total_exploits,
                  to_string(context_.breaker.state()));
    return report;
}

void SecurityMonitor::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard lock(fault_mutex_);
        fault_ = nullptr;
    }
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    io_context_.restart();
    schedule_next();
    loop_thread_ = std::thread([this]() {
        io_context_.run();
    });
    spdlog::info("Security monitor started, interval {}ms",
                 context_.config.monitor_interval.count());
}

void SecurityMonitor::stop() {
    bool was_running = running_.exchange(false);
    io_context_.stop();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    if (was_running) {
        spdlog::info("Security monitor stopped after {} cycles", cycles_.load());
    }
}

void SecurityMonitor::schedule_next() {
    timer_.expires_after(context_.config.monitor_interval);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) return;
        on_timer();
    });
}

void SecurityMonitor::on_timer() {
    if (!running_.load()) return;
    try {
        tick(SteadyClock::now());
    } catch (const std::exception& e) {
        spdlog::critical("Security monitor fault, failing safe: {}", e.what());
        {
            std::lock_guard lock(fault_mutex_);
            fault_ = std::current_exception();
        }
        std::string reason = fmt::format("monitor fault: {}", e.what());
        context_.events.record(Alert{Severity::Critical, reason, WallClock::now()});
        context_.breaker.trip(reason);
        running_.store(false);
        return;
    }
    if (running_.load()) {
        schedule_next();
    }
}

bool SecurityMonitor::faulted() const {
    std::lock_guard lock(fault_mutex_);
    return fault_ != nullptr;
}

void SecurityMonitor::rethrow_fault() const {
    std::exception_ptr fault;
    {
        std::lock_guard lock(fault_mutex_);
        fault = fault_;
    }
    if (fault) {
        std::rethrow_exception(fault);
    }
}

const char* to_string(CycleStatus status) {
    switch (status) {
        case CycleStatus::Evaluated: return "evaluated";
        case CycleStatus::Tripped: return "tripped";
    }
    return "unknown";
}

}  // namespace chaosforge
