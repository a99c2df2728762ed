#include <gtest/gtest.h>
#include "core/context.h"
#include "engine/engine.h"
#include "harness/simulated_target.h"
#include "monitor/security_monitor.h"
#include "telemetry/event_sink.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace chaosforge;
using namespace std::chrono_literals;

namespace {

class RecordingTarget : public TargetProgram {
public:
    explicit RecordingTarget(InvocationResult result, std::chrono::milliseconds delay = 0ms)
        : result_(result), delay_(delay) {}

    InvocationResult invoke(const std::string&, const std::vector<AccountRef>&,
                            const std::vector<uint8_t>&, uint32_t) override {
        calls_.fetch_add(1);
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        return result_;
    }

    int calls() const { return calls_.load(); }

private:
    InvocationResult result_;
    std::chrono::milliseconds delay_;
    std::atomic<int> calls_{0};
};

// Opens the breaker from inside the first invocation
class TrippingTarget : public TargetProgram {
public:
    explicit TrippingTarget(CircuitBreaker& breaker) : breaker_(breaker) {}

    InvocationResult invoke(const std::string&, const std::vector<AccountRef>&,
                            const std::vector<uint8_t>&, uint32_t) override {
        breaker_.trip("tripped by target");
        return InvocationResult::ok(100);
    }

private:
    CircuitBreaker& breaker_;
};

class StdThrowingTarget : public TargetProgram {
public:
    InvocationResult invoke(const std::string&, const std::vector<AccountRef>&,
                            const std::vector<uint8_t>&, uint32_t) override {
        throw std::runtime_error("program aborted");
    }
};

class FatalTarget : public TargetProgram {
public:
    InvocationResult invoke(const std::string&, const std::vector<AccountRef>&,
                            const std::vector<uint8_t>&, uint32_t) override {
        throw 42;
    }
};

Config quiet_config() {
    Config cfg;
    cfg.max_concurrent = 4;
    cfg.max_cpu = 8;
    cfg.max_mem = 8;
    cfg.mutation_rate = 0.0;
    cfg.mutate_accounts = false;
    cfg.mutation_seed = 99;
    return cfg;
}

std::vector<TestCase> make_queue(size_t count) {
    std::vector<TestCase> queue;
    for (size_t i = 0; i < count; ++i) {
        TestCase tc;
        tc.id = "q" + std::to_string(i);
        tc.instruction_payload = {0x00, static_cast<uint8_t>(i)};
        queue.push_back(std::move(tc));
    }
    return queue;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = SteadyClock::now() + limit;
    while (!pred()) {
        if (SteadyClock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

}  // namespace

// ========== Admission ==========

TEST(EngineIntegrationTest, test_oversized_profile_rejected_without_execution) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);

    auto queue = make_queue(1);
    queue[0].resources = ResourceProfile{10, 1};
    RunSummary summary = engine.execute_tests(queue);

    ASSERT_EQ(summary.results.size(), 1u);
    EXPECT_EQ(summary.results[0].status, TestStatus::Rejected);
    EXPECT_FALSE(summary.results[0].outcome.has_value());
    EXPECT_EQ(target.calls(), 0);
    EXPECT_EQ(summary.rejected, 1u);
    EXPECT_EQ(ctx.resources.available_cpu(), 8u);
    // Rejections are not transactions
    EXPECT_EQ(ctx.metrics.snapshot().total_transactions, 0u);
}

TEST(EngineIntegrationTest, test_every_submitted_test_gets_a_result) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);

    auto queue = make_queue(37);
    queue[5].resources = ResourceProfile{9, 1};
    RunSummary summary = engine.execute_tests(queue);

    ASSERT_EQ(summary.results.size(), queue.size());
    for (size_t i = 0; i < queue.size(); ++i) {
        EXPECT_EQ(summary.results[i].test_id, queue[i].id);
    }
    EXPECT_EQ(summary.passed, 36u);
    EXPECT_EQ(summary.rejected, 1u);
    EXPECT_EQ(engine.chunk_size(), 16u);
    EXPECT_EQ(summary.chunks_dispatched, 3u);
}

TEST(EngineIntegrationTest, test_empty_queue) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);

    RunSummary summary = engine.execute_tests({});
    EXPECT_TRUE(summary.results.empty());
    EXPECT_EQ(summary.chunks_dispatched, 0u);
}

TEST(EngineIntegrationTest, test_chunk_size_is_next_power_of_two) {
    EXPECT_EQ(next_power_of_two(0), 1u);
    EXPECT_EQ(next_power_of_two(1), 1u);
    EXPECT_EQ(next_power_of_two(32), 32u);
    EXPECT_EQ(next_power_of_two(33), 64u);
    EXPECT_EQ(next_power_of_two(12), 16u);

    MemoryEventSink sink;
    Config cfg = quiet_config();
    cfg.max_concurrent = 3;
    ChaosContext ctx(cfg, sink);
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);
    EXPECT_EQ(engine.chunk_size(), 16u);
    EXPECT_EQ(engine.seed(), 99u);
}

// ========== Circuit breaker ==========

TEST(EngineIntegrationTest, test_open_breaker_dispatches_nothing) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    ctx.breaker.trip("pre-opened");
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);

    RunSummary summary = engine.execute_tests(make_queue(20));
    EXPECT_EQ(target.calls(), 0);
    EXPECT_EQ(summary.skipped, 20u);
    EXPECT_EQ(summary.chunks_dispatched, 0u);
    EXPECT_TRUE(summary.circuit_breaker_open);
    for (const auto& result : summary.results) {
        EXPECT_EQ(result.status, TestStatus::Skipped);
    }
}

TEST(EngineIntegrationTest, test_breaker_stops_future_chunks_only) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    TrippingTarget target(ctx.breaker);
    Engine engine(ctx, target);

    RunSummary summary = engine.execute_tests(make_queue(100));
    // The chunk in flight when the breaker opened still finishes
    EXPECT_EQ(summary.chunks_dispatched, 1u);
    EXPECT_EQ(summary.passed, engine.chunk_size());
    EXPECT_EQ(summary.skipped, 100u - engine.chunk_size());
    EXPECT_TRUE(summary.circuit_breaker_open);
}

TEST(EngineIntegrationTest, test_breaker_reset_resumes_dispatch) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    ctx.breaker.trip("maintenance");
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);

    EXPECT_EQ(engine.execute_tests(make_queue(5)).skipped, 5u);
    ctx.breaker.reset();
    RunSummary summary = engine.execute_tests(make_queue(5));
    EXPECT_EQ(summary.passed, 5u);
    EXPECT_FALSE(summary.circuit_breaker_open);
}

// ========== Error paths ==========

TEST(EngineIntegrationTest, test_target_exception_releases_resources) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    StdThrowingTarget target;
    Engine engine(ctx, target);

    RunSummary summary = engine.execute_tests(make_queue(12));
    EXPECT_EQ(summary.failed, 12u);
    for (const auto& result : summary.results) {
        EXPECT_EQ(result.error, ExecutionError::ExecutionFailed);
    }
    EXPECT_EQ(ctx.resources.available_cpu(), 8u);
    EXPECT_EQ(ctx.resources.available_mem(), 8u);
    EXPECT_EQ(ctx.metrics.snapshot().failed_transactions, 12u);
}

TEST(EngineIntegrationTest, test_non_standard_throw_is_recorded_as_failure) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    FatalTarget target;
    Engine engine(ctx, target);

    RunSummary summary;
    EXPECT_NO_THROW(summary = engine.execute_tests(make_queue(6)));
    EXPECT_EQ(summary.failed, 6u);
    for (const auto& result : summary.results) {
        EXPECT_EQ(result.status, TestStatus::Failed);
        EXPECT_EQ(result.error, ExecutionError::ExecutionFailed);
    }
    EXPECT_EQ(ctx.resources.available_cpu(), 8u);
    EXPECT_EQ(ctx.resources.available_mem(), 8u);
}

TEST(EngineIntegrationTest, test_fatal_error_is_rethrown_after_chunk) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);

    ctx.metrics.record_exploit_attempt("blocked_instruction",
                                       std::numeric_limits<uint64_t>::max());
    auto queue = make_queue(6);
    for (auto& tc : queue) tc.instruction_payload = {0xFF, 0xFF, 0xFF, 0xFF};

    EXPECT_THROW(engine.execute_tests(queue), std::overflow_error);
    EXPECT_EQ(target.calls(), 0);
    EXPECT_EQ(ctx.resources.available_cpu(), 8u);
    EXPECT_EQ(ctx.resources.available_mem(), 8u);
}

TEST(EngineIntegrationTest, test_timeout_status) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    RecordingTarget target(InvocationResult::ok(10), 20ms);
    Engine engine(ctx, target);

    auto queue = make_queue(2);
    for (auto& tc : queue) tc.timeout = 1ms;
    RunSummary summary = engine.execute_tests(queue);
    EXPECT_EQ(summary.timeouts, 2u);
    EXPECT_EQ(summary.interesting, 2u);
    EXPECT_EQ(summary.results[0].status, TestStatus::Timeout);
}

// ========== Signals into the monitor ==========

TEST(EngineIntegrationTest, test_security_violation_recorded_as_exploit) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);

    auto queue = make_queue(3);
    queue[1].instruction_payload = {0x00, 0xFF, 0xFF, 0xFF, 0xFF};
    RunSummary summary = engine.execute_tests(queue);

    EXPECT_EQ(target.calls(), 2);
    EXPECT_EQ(summary.results[1].error, ExecutionError::SecurityViolation);
    auto snap = ctx.metrics.snapshot();
    EXPECT_EQ(snap.exploit_attempts["blocked_instruction"], 1u);
    EXPECT_EQ(snap.total_transactions, 3u);
    EXPECT_EQ(snap.failed_transactions, 1u);

    auto findings = sink.findings();
    EXPECT_TRUE(std::any_of(findings.begin(), findings.end(), [](const Finding& f) {
        return f.category == FindingCategory::SecurityVulnerability && f.related_test_id == "q1";
    }));
}

TEST(EngineIntegrationTest, test_unexpected_success_recorded_as_manipulation) {
    MemoryEventSink sink;
    ChaosContext ctx(quiet_config(), sink);
    RecordingTarget target(InvocationResult::ok(10));
    Engine engine(ctx, target);

    auto queue = make_queue(4);
    for (auto& tc : queue) tc.expected_result = ExpectedResult::fail_with(3);
    RunSummary summary = engine.execute_tests(queue);

    EXPECT_EQ(summary.failed, 4u);
    EXPECT_EQ(ctx.metrics.snapshot().execution_manipulations, 4u);
    EXPECT_EQ(sink.finding_count(), 4u);
}

// ========== Monitor loop ==========

TEST(MonitorLoopTest, test_loop_trips_breaker) {
    MemoryEventSink sink;
    Config cfg = quiet_config();
    cfg.monitor_interval = 10ms;
    ChaosContext ctx(cfg, sink);
    SecurityMonitor monitor(ctx);

    monitor.start();
    EXPECT_TRUE(monitor.is_running());
    ctx.metrics.record_manipulation(ManipulationKind::Vote, 51);
    EXPECT_TRUE(wait_until([&] { return ctx.breaker.is_open(); }));
    monitor.stop();

    EXPECT_FALSE(monitor.is_running());
    EXPECT_GT(monitor.cycles(), 0u);
    EXPECT_FALSE(monitor.faulted());
    EXPECT_EQ(sink.alert_count(), 1u);
}

TEST(MonitorLoopTest, test_loop_restarts_after_stop) {
    MemoryEventSink sink;
    Config cfg = quiet_config();
    cfg.monitor_interval = 5ms;
    ChaosContext ctx(cfg, sink);
    SecurityMonitor monitor(ctx);

    monitor.start();
    EXPECT_TRUE(wait_until([&] { return monitor.cycles() >= 2; }));
    monitor.stop();
    uint64_t after_first = monitor.cycles();

    monitor.start();
    EXPECT_TRUE(wait_until([&] { return monitor.cycles() >= after_first + 2; }));
    monitor.stop();
}

TEST(MonitorLoopTest, test_loop_fault_fails_safe) {
    MemoryEventSink sink;
    Config cfg = quiet_config();
    cfg.monitor_interval = 5ms;
    ChaosContext ctx(cfg, sink);
    SecurityMonitor monitor(ctx);

    ctx.metrics.record_manipulation(ManipulationKind::Vote, std::numeric_limits<uint64_t>::max());
    ctx.metrics.record_manipulation(ManipulationKind::Execution, 1);
    monitor.start();
    EXPECT_TRUE(wait_until([&] { return monitor.faulted(); }));
    EXPECT_TRUE(wait_until([&] { return !monitor.is_running(); }));
    monitor.stop();

    EXPECT_TRUE(ctx.breaker.is_open());
    EXPECT_THROW(monitor.rethrow_fault(), std::overflow_error);
    auto alerts = sink.alerts();
    ASSERT_FALSE(alerts.empty());
    EXPECT_EQ(alerts.back().severity, Severity::Critical);
}

TEST(MonitorLoopTest, test_monitor_halts_running_engine) {
    MemoryEventSink sink;
    Config cfg = quiet_config();
    cfg.max_concurrent = 2;
    cfg.monitor_interval = 5ms;
    ChaosContext ctx(cfg, sink);
    // Every test fails where success was expected
    RecordingTarget target(InvocationResult::failure(ProgramError::InsufficientFunds, 10), 5ms);
    SecurityMonitor monitor(ctx);
    Engine engine(ctx, target);

    monitor.start();
    RunSummary summary = engine.execute_tests(make_queue(256));
    monitor.stop();

    EXPECT_TRUE(summary.circuit_breaker_open);
    EXPECT_GT(summary.skipped, 0u);
    EXPECT_EQ(summary.failed + summary.skipped, 256u);
    EXPECT_LT(target.calls(), 256);
}

// ========== Seed corpus ==========

TEST(EngineIntegrationTest, test_seed_corpus_run_on_simulated_target) {
    MemoryEventSink sink;
    Config cfg = quiet_config();
    cfg.corpus_size = 60;
    ChaosContext ctx(cfg, sink);
    SimulatedTarget target;
    SecurityMonitor monitor(ctx);
    Engine engine(ctx, target);

    RunSummary summary = engine.execute_tests(make_seed_corpus(ctx.config));
    EXPECT_EQ(summary.rejected, 0u);
    EXPECT_EQ(summary.passed, 60u);
    EXPECT_EQ(summary.interesting, 0u);
    // Every sixth seed burns past the critical compute threshold
    EXPECT_EQ(summary.critical_findings, 10u);
    EXPECT_EQ(target.invocations(), 60u);

    CycleReport report = monitor.tick(SteadyClock::now());
    EXPECT_EQ(report.status, CycleStatus::Evaluated);
    EXPECT_EQ(report.snapshot.total_transactions, 60u);
    EXPECT_EQ(report.snapshot.anomalies, 10u);
    EXPECT_FALSE(ctx.breaker.is_open());
}
