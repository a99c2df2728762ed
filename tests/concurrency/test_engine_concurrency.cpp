#include <gtest/gtest.h>
#include "core/context.h"
#include "engine/engine.h"
#include "engine/worker_pool.h"
#include "harness/target.h"
#include "telemetry/event_sink.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using namespace chaosforge;

namespace {

// Tracks how many invocations overlap
class CountingTarget : public TargetProgram {
public:
    InvocationResult invoke(const std::string&, const std::vector<AccountRef>&,
                            const std::vector<uint8_t>&, uint32_t) override {
        int now = active_.fetch_add(1) + 1;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        active_.fetch_sub(1);
        calls_.fetch_add(1);
        return InvocationResult::ok(5000);
    }

    int peak() const { return peak_.load(); }
    int calls() const { return calls_.load(); }

private:
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};
};

Config engine_config() {
    Config cfg;
    cfg.max_concurrent = 8;
    cfg.max_cpu = 8;
    cfg.max_mem = 8;
    cfg.mutation_rate = 0.0;
    cfg.mutate_accounts = false;
    cfg.mutation_seed = 7;
    return cfg;
}

std::vector<TestCase> make_queue(size_t count) {
    std::vector<TestCase> queue;
    for (size_t i = 0; i < count; ++i) {
        TestCase tc;
        tc.id = "t" + std::to_string(i);
        tc.instruction_payload = {0x00, static_cast<uint8_t>(i)};
        tc.resources = ResourceProfile{1, 1};
        queue.push_back(std::move(tc));
    }
    return queue;
}

}  // namespace

// ========== Engine ==========

TEST(EngineConcurrencyTest, test_hundred_tests_at_most_eight_in_flight) {
    MemoryEventSink sink;
    ChaosContext ctx(engine_config(), sink);
    CountingTarget target;
    Engine engine(ctx, target);

    RunSummary summary = engine.execute_tests(make_queue(100));

    ASSERT_EQ(summary.results.size(), 100u);
    EXPECT_EQ(target.calls(), 100);
    EXPECT_LE(summary.peak_in_flight, 8u);
    EXPECT_GE(summary.peak_in_flight, 1u);
    EXPECT_LE(target.peak(), 8);
    // With 8 workers and capacity for 8, no test is ever refused
    EXPECT_EQ(summary.rejected, 0u);
    EXPECT_EQ(summary.passed + summary.failed + summary.timeouts, 100u);
    EXPECT_EQ(ctx.resources.available_cpu(), 8u);
    EXPECT_EQ(ctx.resources.available_mem(), 8u);
    EXPECT_EQ(summary.chunks_dispatched, 4u);
}

TEST(EngineConcurrencyTest, test_tight_capacity_rejects_instead_of_blocking) {
    MemoryEventSink sink;
    Config cfg = engine_config();
    cfg.max_cpu = 2;
    ChaosContext ctx(cfg, sink);
    CountingTarget target;
    Engine engine(ctx, target);

    RunSummary summary = engine.execute_tests(make_queue(64));

    ASSERT_EQ(summary.results.size(), 64u);
    EXPECT_LE(target.peak(), 2);
    EXPECT_EQ(static_cast<size_t>(target.calls()) + summary.rejected, 64u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(ctx.resources.available_cpu(), 2u);
}

TEST(EngineConcurrencyTest, test_results_independent_of_scheduling) {
    Config cfg = engine_config();
    cfg.mutation_rate = 1.0;
    cfg.mutation_intensity = 3;
    cfg.mutate_accounts = true;
    auto queue = make_queue(48);
    for (auto& tc : queue) {
        tc.target_accounts = {AccountRef{"Payer1111", true, true}};
        tc.expected_result = ExpectedResult::revert();
    }

    std::vector<std::pair<TestStatus, bool>> first;
    std::vector<std::pair<TestStatus, bool>> second;
    for (auto* out : {&first, &second}) {
        MemoryEventSink sink;
        ChaosContext ctx(cfg, sink);
        CountingTarget target;
        Engine engine(ctx, target);
        for (const auto& result : engine.execute_tests(queue).results) {
            out->emplace_back(result.status, result.metrics.accounts_mutated);
        }
    }
    EXPECT_EQ(first, second);
}

// ========== WorkerPool ==========

TEST(WorkerPoolTest, test_runs_every_posted_task) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(4);
        EXPECT_EQ(pool.size(), 4u);
        for (int i = 0; i < 500; ++i) {
            pool.post([&done]() { done.fetch_add(1); });
        }
        pool.stop();
    }
    EXPECT_EQ(done.load(), 500);
}

TEST(WorkerPoolTest, test_tasks_run_in_parallel) {
    WorkerPool pool(4);
    std::mutex mutex;
    std::condition_variable cv;
    int arrived = 0;

    // All four tasks must be running at once to get past the rendezvous
    for (int i = 0; i < 4; ++i) {
        pool.post([&]() {
            std::unique_lock lock(mutex);
            ++arrived;
            cv.notify_all();
            cv.wait_for(lock, std::chrono::seconds(5), [&] { return arrived == 4; });
        });
    }
    pool.stop();
    EXPECT_EQ(arrived, 4);
}
