#include "harness/executor.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <exception>
#include <utility>

namespace chaosforge {

namespace {

constexpr std::array<uint8_t, 4> kBlockedPattern = {0xFF, 0xFF, 0xFF, 0xFF};

bool contains_blocked_pattern(const std::vector<uint8_t>& payload) {
    return std::search(payload.begin(), payload.end(),
                       kBlockedPattern.begin(), kBlockedPattern.end()) != payload.end();
}

Severity failure_severity(ProgramError error) {
    switch (error) {
        case ProgramError::InvalidAccountData:
        case ProgramError::InsufficientFunds:
        case ProgramError::ComputeBudgetExceeded:
            return Severity::High;
        case ProgramError::InvalidArgument:
        case ProgramError::AccountAlreadyInitialized:
            return Severity::Medium;
        case ProgramError::Custom:
            return Severity::Low;
    }
    return Severity::Low;
}

}  // namespace

const char* to_string(ProgramError error) {
    switch (error) {
        case ProgramError::Custom: return "custom";
        case ProgramError::InvalidArgument: return "invalid_argument";
        case ProgramError::InvalidAccountData: return "invalid_account_data";
        case ProgramError::InsufficientFunds: return "insufficient_funds";
        case ProgramError::AccountAlreadyInitialized: return "account_already_initialized";
        case ProgramError::ComputeBudgetExceeded: return "compute_budget_exceeded";
    }
    return "unknown";
}

ExecutorLimits ExecutorLimits::from_config(const Config& config) {
    ExecutorLimits limits;
    limits.program_id = config.program_id;
    limits.high_cost_units = config.high_cost_units;
    limits.critical_cost_units = config.critical_cost_units;
    limits.slow_execution = config.slow_execution;
    limits.max_instruction_size = config.max_instruction_size;
    return limits;
}

Executor::Executor(TargetProgram& target, ExecutorLimits limits)
    : target_(target), limits_(std::move(limits)) {}

ExecutionOutcome Executor::classify(const InvocationResult& invocation,
                                    const ExpectedResult& expected) {
    if (invocation.success) {
        return expected.kind() == ExpectedResult::Kind::Success
                   ? ExecutionOutcome::Ok
                   : ExecutionOutcome::Crash;
    }
    switch (expected.kind()) {
        case ExpectedResult::Kind::Revert:
            return ExecutionOutcome::Ok;
        case ExpectedResult::Kind::FailWith:
            if (invocation.error == ProgramError::Custom && invocation.code == expected.code()) {
                return ExecutionOutcome::Ok;
            }
            return ExecutionOutcome::Crash;
        case ExpectedResult::Kind::Success:
            return ExecutionOutcome::Crash;
    }
    return ExecutionOutcome::Crash;
}

bool Executor::screen(const TestCase& test_case, Execution& execution) const {
    const auto& payload = test_case.instruction_payload;
    std::string violation;
    if (payload.size() > limits_.max_instruction_size) {
        violation = fmt::format("instruction payload of {} bytes exceeds limit of {}",
                                payload.size(), limits_.max_instruction_size);
    } else if (contains_blocked_pattern(payload)) {
        violation = "instruction payload contains blocked byte pattern";
    }
    if (!violation.empty()) {
        execution.outcome = ExecutionOutcome::Crash;
        execution.error = ExecutionError::SecurityViolation;
        execution.findings.push_back(Finding::make(FindingCategory::SecurityVulnerability,
                                                   Severity::High, std::move(violation),
                                                   test_case.id));
        return false;
    }

    for (size_t i = 0; i < test_case.target_accounts.size(); ++i) {
        const auto& address = test_case.target_accounts[i].address;
        if (address.empty() || address.size() > kMaxAccountAddressLength) {
            execution.outcome = ExecutionOutcome::Crash;
            execution.error = ExecutionError::AccountValidation;
            execution.findings.push_back(Finding::make(
                FindingCategory::SecurityVulnerability, Severity::Medium,
                fmt::format("account {} has an invalid address of length {}", i, address.size()),
                test_case.id));
            return false;
        }
    }
    return true;
}

void Executor::analyze_failure(const TestCase& test_case, const InvocationResult& invocation,
                               Execution& execution) const {
    if (invocation.success) {
        execution.unexpected_success = true;
        execution.findings.push_back(Finding::make(
            FindingCategory::LogicError, Severity::High,
            fmt::format("program succeeded where {} was expected",
                        to_string(test_case.expected_result.kind())),
            test_case.id));
        return;
    }

    std::string description = invocation.error == ProgramError::Custom
        ? fmt::format("program failed with custom error {}", invocation.code)
        : fmt::format("program failed with {}", to_string(invocation.error));
    execution.findings.push_back(Finding::make(FindingCategory::TransactionError,
                                               failure_severity(invocation.error),
                                               std::move(description), test_case.id));
}

void Executor::analyze_cost(const TestCase& test_case, Execution& execution) const {
    if (execution.compute_units > limits_.critical_cost_units) {
        execution.findings.push_back(Finding::make(
            FindingCategory::PerformanceIssue, Severity::Critical,
            fmt::format("compute usage {} exceeds critical threshold {}",
                        execution.compute_units, limits_.critical_cost_units),
            test_case.id));
    } else if (execution.compute_units > limits_.high_cost_units) {
        execution.findings.push_back(Finding::make(
            FindingCategory::PerformanceIssue, Severity::High,
            fmt::format("compute usage {} exceeds threshold {}",
                        execution.compute_units, limits_.high_cost_units),
            test_case.id));
    }

    if (execution.error != ExecutionError::Timeout && execution.elapsed > limits_.slow_execution) {
        execution.findings.push_back(Finding::make(
            FindingCategory::PerformanceIssue, Severity::Medium,
            fmt::format("execution took {}us, slower than {}ms",
                        execution.elapsed.count(), limits_.slow_execution.count()),
            test_case.id));
    }
}

Execution Executor::run(const TestCase& test_case, uint32_t compute_budget,
                        std::chrono::milliseconds timeout) {
    Execution execution;
    if (!screen(test_case, execution)) {
        spdlog::debug("Test {} screened out: {}", test_case.id, to_string(*execution.error));
        return execution;
    }

    auto start = SteadyClock::now();
    InvocationResult invocation;
    bool raised = false;
    try {
        invocation = target_.invoke(limits_.program_id, test_case.target_accounts,
                                    test_case.instruction_payload, compute_budget);
    } catch (const std::exception& e) {
        raised = true;
        spdlog::error("Target raised during test {}: {}", test_case.id, e.what());
        execution.findings.push_back(Finding::make(
            FindingCategory::TransactionError, Severity::High,
            fmt::format("target raised: {}", e.what()), test_case.id));
    } catch (...) {
        raised = true;
        spdlog::error("Target raised a non-standard exception during test {}", test_case.id);
        execution.findings.push_back(Finding::make(
            FindingCategory::TransactionError, Severity::High,
            "target raised a non-standard exception", test_case.id));
    }
    execution.elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start);
    execution.invoked = true;

    if (raised) {
        execution.outcome = ExecutionOutcome::Crash;
        execution.error = ExecutionError::ExecutionFailed;
    } else {
        execution.compute_units = invocation.compute_units;
        execution.outcome = classify(invocation, test_case.expected_result);
        if (execution.outcome == ExecutionOutcome::Crash) {
            execution.error = ExecutionError::ExecutionFailed;
            analyze_failure(test_case, invocation, execution);
        }
    }

    if (execution.elapsed > timeout) {
        execution.outcome = ExecutionOutcome::Crash;
        execution.error = ExecutionError::Timeout;
        execution.findings.push_back(Finding::make(
            FindingCategory::PerformanceIssue, Severity::High,
            fmt::format("execution took {}us, over the {}ms timeout",
                        execution.elapsed.count(), timeout.count()),
            test_case.id));
    }

    analyze_cost(test_case, execution);
    return execution;
}

}  // namespace chaosforge
