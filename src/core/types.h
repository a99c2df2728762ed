#pragma once
#ifndef CHAOSFORGE_TYPES_H
#define CHAOSFORGE_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chaosforge {

using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// Declared cost of one test case, used for admission accounting
struct ResourceProfile {
    uint32_t cpu = 0;
    uint32_t mem = 0;

    bool operator==(const ResourceProfile& other) const = default;
};

struct AccountRef {
    std::string address;
    bool is_signer = false;
    bool is_writable = false;

    bool operator==(const AccountRef& other) const = default;
};

class ExpectedResult {
public:
    enum class Kind { Success, FailWith, Revert };

    static ExpectedResult success() { return ExpectedResult(Kind::Success, 0); }
    static ExpectedResult fail_with(uint32_t code) { return ExpectedResult(Kind::FailWith, code); }
    static ExpectedResult revert() { return ExpectedResult(Kind::Revert, 0); }

    Kind kind() const { return kind_; }
    // Only meaningful for Kind::FailWith
    uint32_t code() const { return code_; }

    bool operator==(const ExpectedResult& other) const = default;

private:
    ExpectedResult(Kind kind, uint32_t code) : kind_(kind), code_(code) {}

    Kind kind_;
    uint32_t code_;
};

struct TestCase {
    std::string id;
    std::vector<uint8_t> instruction_payload;
    std::vector<AccountRef> target_accounts;
    ExpectedResult expected_result = ExpectedResult::success();

    // Static per-test metadata
    ResourceProfile resources{1, 1};
    uint32_t compute_budget = 200000;
    std::chrono::milliseconds timeout{5000};
};

enum class ExecutionOutcome { Ok, Crash };

enum class ExecutionError {
    ExecutionFailed,
    Timeout,
    AccountValidation,
    SecurityViolation,
};

enum class TestStatus {
    Passed,
    Failed,
    Timeout,
    Rejected,  // InsufficientCapacity at admission, never executed
    Skipped,   // not dispatched, circuit breaker was open
};

enum class Severity { Low, Medium, High, Critical };

enum class FindingCategory {
    PerformanceIssue,
    SecurityVulnerability,
    TransactionError,
    LogicError,
};

struct Finding {
    FindingCategory category;
    Severity severity;
    std::string description;
    WallTime timestamp;
    std::string related_test_id;

    static Finding make(FindingCategory category, Severity severity,
                        std::string description, std::string test_id);
};

struct Alert {
    Severity severity;
    std::string message;
    WallTime timestamp;
};

struct TestMetrics {
    uint64_t compute_units = 0;
    std::chrono::microseconds elapsed{0};
    uint32_t mutation_rounds = 0;
    bool accounts_mutated = false;
};

struct TestResult {
    std::string test_id;
    TestStatus status = TestStatus::Skipped;
    std::optional<ExecutionOutcome> outcome;
    std::optional<ExecutionError> error;
    std::vector<Finding> findings;
    TestMetrics metrics;
};

const char* to_string(ExpectedResult::Kind kind);
const char* to_string(ExecutionOutcome outcome);
const char* to_string(ExecutionError error);
const char* to_string(TestStatus status);
const char* to_string(Severity severity);
const char* to_string(FindingCategory category);

}  // namespace chaosforge

#endif  // CHAOSFORGE_TYPES_H
