#pragma once
#ifndef CHAOSFORGE_ENGINE_H
#define CHAOSFORGE_ENGINE_H

#include "core/context.h"
#include "core/types.h"
#include "engine/worker_pool.h"
#include "fuzz/mutator.h"
#include "harness/executor.h"
#include "harness/target.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace chaosforge {

struct RunSummary {
    std::vector<TestResult> results;  // one per submitted test, queue order
    size_t passed = 0;
    size_t failed = 0;
    size_t timeouts = 0;
    size_t rejected = 0;
    size_t skipped = 0;
    size_t interesting = 0;  // failed + timed out
    size_t critical_findings = 0;
    size_t chunks_dispatched = 0;
    size_t peak_in_flight = 0;
    bool circuit_breaker_open = false;
};

// Smallest power of two >= n (1 for n == 0)
size_t next_power_of_two(size_t n);

class Engine {
public:
    Engine(ChaosContext& context, TargetProgram& target);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Runs the queue chunk by chunk, checking the circuit breaker before
    // each chunk. Tests left undispatched come back as Skipped. An error
    // that is not a per-test outcome (e.g. counter overflow) is rethrown
    // after the current chunk drains.
    RunSummary execute_tests(const std::vector<TestCase>& queue);

    size_t chunk_size() const { return chunk_size_; }
    uint64_t seed() const { return seed_; }

private:
    TestResult run_one(const TestCase& test_case, size_t index);
    void record_signals(const TestResult& result);
    void note_in_flight(size_t value);

    ChaosContext& context_;
    Executor executor_;
    MutationConfig mutation_;
    uint64_t seed_;
    size_t chunk_size_;
    WorkerPool workers_;

    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
};

}  // namespace chaosforge

#endif  // CHAOSFORGE_ENGINE_H
