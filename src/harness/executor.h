#pragma once
#ifndef CHAOSFORGE_EXECUTOR_H
#define CHAOSFORGE_EXECUTOR_H

#include "config/config.h"
#include "core/types.h"
#include "harness/target.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chaosforge {

struct ExecutorLimits {
    std::string program_id = "ChaosTarget11111111111111111111111111111111";
    uint64_t high_cost_units = 200000;
    uint64_t critical_cost_units = 1400000;
    std::chrono::milliseconds slow_execution{200};
    size_t max_instruction_size = 1024;

    static ExecutorLimits from_config(const Config& config);
};

inline constexpr size_t kMaxAccountAddressLength = 44;

struct Execution {
    ExecutionOutcome outcome = ExecutionOutcome::Ok;
    std::optional<ExecutionError> error;
    std::vector<Finding> findings;
    uint64_t compute_units = 0;
    std::chrono::microseconds elapsed{0};
    bool invoked = false;
    bool unexpected_success = false;
};

class Executor {
public:
    Executor(TargetProgram& target, ExecutorLimits limits);

    // Invokes the target once and classifies the result against the test's
    // expectation. Timeout is checked after the call returns; the target is
    // never interrupted.
    Execution run(const TestCase& test_case, uint32_t compute_budget,
                  std::chrono::milliseconds timeout);

    static ExecutionOutcome classify(const InvocationResult& invocation,
                                     const ExpectedResult& expected);

    const ExecutorLimits& limits() const { return limits_; }

private:
    // Rejects inputs that must never reach the target
    bool screen(const TestCase& test_case, Execution& execution) const;
    void analyze_failure(const TestCase& test_case, const InvocationResult& invocation,
                         Execution& execution) const;
    void analyze_cost(const TestCase& test_case, Execution& execution) const;

    TargetProgram& target_;
    ExecutorLimits limits_;
};

}  // namespace chaosforge

#endif  // CHAOSFORGE_EXECUTOR_H
