#include "engine/engine.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <utility>

namespace chaosforge {

namespace {

// Blocks the dispatcher until every task of a chunk has reported back
class ChunkBarrier {
public:
    explicit ChunkBarrier(size_t pending) : pending_(pending) {}

    void arrive(std::exception_ptr error = nullptr) {
        std::lock_guard lock(mutex_);
        if (error && !error_) {
            error_ = error;
        }
        if (--pending_ == 0) {
            cv_.notify_all();
        }
    }

    std::exception_ptr wait() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return pending_ == 0; });
        return error_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t pending_;
    std::exception_ptr error_;
};

uint64_t resolve_seed(const Config& config) {
    if (config.mutation_seed) {
        return *config.mutation_seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

TestStatus status_of(const Execution& execution) {
    if (execution.outcome == ExecutionOutcome::Ok) return TestStatus::Passed;
    if (execution.error == ExecutionError::Timeout) return TestStatus::Timeout;
    return TestStatus::Failed;
}

}  // namespace

size_t next_power_of_two(size_t n) {
    size_t p = 1;
    while (p < n) {
        p <<= 1;
    }
    return p;
}

Engine::Engine(ChaosContext& context, TargetProgram& target)
    : context_(context),
      executor_(target, ExecutorLimits::from_config(context.config)),
      mutation_{context.config.mutation_rate, context.config.mutation_intensity,
                context.config.mutate_accounts},
      seed_(resolve_seed(context.config)),
      chunk_size_(next_power_of_two(context.config.max_concurrent * 4)),
      workers_(context.config.max_concurrent) {
    spdlog::info("Engine ready: {} workers, chunk size {}, mutation seed {}",
                 context.config.max_concurrent, chunk_size_, seed_);
    // std::thread exposes no stack size, workers run with the platform default
    spdlog::debug("Requested worker stack size {} bytes", context.config.worker_stack_bytes);
}

void Engine::note_in_flight(size_t value) {
    size_t peak = peak_in_flight_.load(std::memory_order_relaxed);
    while (value > peak &&
           !peak_in_flight_.compare_exchange_weak(peak, value, std::memory_order_relaxed)) {
    }
}

void Engine::record_signals(const TestResult& result) {
    auto& metrics = context_.metrics;
    metrics.record_transaction(result.outcome == ExecutionOutcome::Ok);

    if (result.error == ExecutionError::SecurityViolation) {
        metrics.record_exploit_attempt("blocked_instruction");
    } else if (result.error == ExecutionError::AccountValidation) {
        metrics.record_exploit_attempt("invalid_account");
    }

    for (const auto& finding : result.findings) {
        if (finding.category == FindingCategory::LogicError) {
            metrics.record_manipulation(ManipulationKind::Execution);
        } else if (finding.category == FindingCategory::PerformanceIssue) {
            metrics.record_anomaly();
        }
        context_.events.record(finding);
    }
}

TestResult Engine::run_one(const TestCase& test_case, size_t index) {
    TestResult result;
    result.test_id = test_case.id;

    // Per-test stream so results do not depend on which worker ran the test
    std::seed_seq seq{static_cast<uint32_t>(seed_), static_cast<uint32_t>(seed_ >> 32),
                      static_cast<uint32_t>(index), static_cast<uint32_t>(index >> 32)};
    std::mt19937_64 rng(seq);
    MutationResult mutated = mutate_tracked(test_case, mutation_, rng);
    result.metrics.mutation_rounds = mutated.rounds_applied;
    result.metrics.accounts_mutated = mutated.accounts_mutated;

    ResourceLease lease(context_.resources, mutated.test_case.resources);
    if (!lease) {
        result.status = TestStatus::Rejected;
        spdlog::debug("Test {} rejected: insufficient capacity for cpu={} mem={}",
                      test_case.id, mutated.test_case.resources.cpu,
                      mutated.test_case.resources.mem);
        return result;
    }

    note_in_flight(in_flight_.fetch_add(1) + 1);
    spdlog::debug("Dispatching test {} ({} mutation rounds)", test_case.id,
                  mutated.rounds_applied);
    Execution execution;
    try {
        execution = executor_.run(mutated.test_case, test_case.compute_budget,
                                  test_case.timeout);
    } catch (...) {
        in_flight_.fetch_sub(1);
        throw;
    }
    in_flight_.fetch_sub(1);
    lease.release();

    result.status = status_of(execution);
    result.outcome = execution.outcome;
    result.error = execution.error;
    result.findings = std::move(execution.findings);
    result.metrics.compute_units = execution.compute_units;
    result.metrics.elapsed = execution.elapsed;

    record_signals(result);
    return result;
}

RunSummary Engine::execute_tests(const std::vector<TestCase>& queue) {
    RunSummary summary;
    summary.results.resize(queue.size());
    for (size_t i = 0; i < queue.size(); ++i) {
        summary.results[i].test_id = queue[i].id;
    }
    peak_in_flight_.store(0);

    spdlog::info("Executing {} tests in chunks of {}", queue.size(), chunk_size_);

    for (size_t start = 0; start < queue.size(); start += chunk_size_) {
        if (context_.breaker.is_open()) {
            spdlog::warn("Circuit breaker open, {} tests left undispatched",
                         queue.size() - start);
            break;
        }

        size_t end = std::min(queue.size(), start + chunk_size_);
        ChunkBarrier barrier(end - start);
        ++summary.chunks_dispatched;

        for (size_t i = start; i < end; ++i) {
            workers_.post([this, &queue, &summary, &barrier, i]() {
                try {
                    summary.results[i] = run_one(queue[i], i);
                } catch (...) {
                    barrier.arrive(std::current_exception());
                    return;
                }
                barrier.arrive();
            });
        }

        if (std::exception_ptr error = barrier.wait()) {
            spdlog::error("Chunk {} aborted by a fatal error", summary.chunks_dispatched);
            std::rethrow_exception(error);
        }
    }

    for (const auto& result : summary.results) {
        switch (result.status) {
            case TestStatus::Passed: ++summary.passed; break;
            case TestStatus::Failed: ++summary.failed; break;
            case TestStatus::Timeout: ++summary.timeouts; break;
            case TestStatus::Rejected: ++summary.rejected; break;
            case TestStatus::Skipped: ++summary.skipped; break;
        }
        for (const auto& finding : result.findings) {
            if (finding.severity == Severity::Critical) {
                ++summary.critical_findings;
            }
        }
    }
    summary.interesting = summary.failed + summary.timeouts;
    summary.peak_in_flight = peak_in_flight_.load();
    summary.circuit_breaker_open = context_.breaker.is_open();

    spdlog::info("Run finished: passed={} failed={} timeouts={} rejected={} skipped={} "
                 "critical_findings={} breaker={}",
                 summary.passed, summary.failed, summary.timeouts, summary.rejected,
                 summary.skipped, summary.critical_findings,
                 summary.circuit_breaker_open ? "open" : "closed");
    return summary;
}

}  // namespace chaosforge
