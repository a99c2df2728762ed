#pragma once
#ifndef CHAOSFORGE_CONTEXT_H
#define CHAOSFORGE_CONTEXT_H

#include "config/config.h"
#include "monitor/circuit_breaker.h"
#include "monitor/security_metrics.h"
#include "resources/resource_pool.h"
#include "telemetry/event_sink.h"

namespace chaosforge {

// Shared state of one chaos run, built once and handed to the engine and
// the monitor by reference. Must outlive both.
struct ChaosContext {
    explicit ChaosContext(Config cfg, EventSink& sink);

    ChaosContext(const ChaosContext&) = delete;
    ChaosContext& operator=(const ChaosContext&) = delete;

    const Config config;
    ResourcePool resources;
    SecurityMetrics metrics;
    CircuitBreaker breaker;
    EventSink& events;
};

}  // namespace chaosforge

#endif  // CHAOSFORGE_CONTEXT_H
