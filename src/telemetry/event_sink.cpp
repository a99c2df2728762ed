#include "telemetry/event_sink.h"
#include <spdlog/spdlog.h>

namespace chaosforge {

void LogEventSink::record(const Finding& finding) {
    spdlog::warn("[{}/{}] {} (test {})", to_string(finding.category),
                 to_string(finding.severity), finding.description, finding.related_test_id);
}

void LogEventSink::record(const Alert& alert) {
    if (alert.severity == Severity::Critical) {
        spdlog::critical("ALERT: {}", alert.message);
    } else {
        spdlog::warn("ALERT [{}]: {}", to_string(alert.severity), alert.message);
    }
}

MemoryEventSink::MemoryEventSink(size_t capacity) : capacity_(capacity) {}

void MemoryEventSink::record(const Finding& finding) {
    std::lock_guard lock(mutex_);
    if (capacity_ == 0) {
        ++dropped_;
        return;
    }
    if (findings_.size() >= capacity_) {
        findings_.pop_front();
        ++dropped_;
    }
    findings_.push_back(finding);
}

void MemoryEventSink::record(const Alert& alert) {
    std::lock_guard lock(mutex_);
    if (capacity_ == 0) {
        ++dropped_;
        return;
    }
    if (alerts_.size() >= capacity_) {
        alerts_.pop_front();
        ++dropped_;
    }
    alerts_.push_back(alert);
}

std::vector<Finding> MemoryEventSink::findings() const {
    std::lock_guard lock(mutex_);
    return {findings_.begin(), findings_.end()};
}

std::vector<Alert> MemoryEventSink::alerts() const {
    std::lock_guard lock(mutex_);
    return {alerts_.begin(), alerts_.end()};
}

size_t MemoryEventSink::finding_count() const {
    std::lock_guard lock(mutex_);
    return findings_.size();
}

size_t MemoryEventSink::alert_count() const {
    std::lock_guard lock(mutex_);
    return alerts_.size();
}

size_t MemoryEventSink::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

void MemoryEventSink::clear() {
    std::lock_guard lock(mutex_);
    findings_.clear();
    alerts_.clear();
    dropped_ = 0;
}

}  // namespace chaosforge
