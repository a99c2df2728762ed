#pragma once
#ifndef CHAOSFORGE_EVENT_SINK_H
#define CHAOSFORGE_EVENT_SINK_H

#include "core/types.h"
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace chaosforge {

// Receives findings and alerts. Calls come from engine workers and the
// monitor thread at the same time.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void record(const Finding& finding) = 0;
    virtual void record(const Alert& alert) = 0;
};

class LogEventSink : public EventSink {
public:
    void record(const Finding& finding) override;
    void record(const Alert& alert) override;
};

// Keeps the most recent events; older ones are dropped once capacity is hit
class MemoryEventSink : public EventSink {
public:
    explicit MemoryEventSink(size_t capacity = 4096);

    void record(const Finding& finding) override;
    void record(const Alert& alert) override;

    std::vector<Finding> findings() const;
    std::vector<Alert> alerts() const;
    size_t finding_count() const;
    size_t alert_count() const;
    size_t dropped() const;
    void clear();

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Finding> findings_;
    std::deque<Alert> alerts_;
    size_t dropped_ = 0;
};

}  // namespace chaosforge

#endif  // CHAOSFORGE_EVENT_SINK_H
