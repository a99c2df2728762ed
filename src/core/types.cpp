#include "core/types.h"
#include <utility>

namespace chaosforge {

Finding Finding::make(FindingCategory category, Severity severity,
                      std::string description, std::string test_id) {
    return Finding{category, severity, std::move(description), WallClock::now(),
                   std::move(test_id)};
}

const char* to_string(ExpectedResult::Kind kind) {
    switch (kind) {
        case ExpectedResult::Kind::Success: return "success";
        case ExpectedResult::Kind::FailWith: return "fail_with";
        case ExpectedResult::Kind::Revert: return "revert";
    }
    return "unknown";
}

const char* to_string(ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::Ok: return "ok";
        case ExecutionOutcome::Crash: return "crash";
    }
    return "unknown";
}

const char* to_string(ExecutionError error) {
    switch (error) {
        case ExecutionError::ExecutionFailed: return "execution_failed";
        case ExecutionError::Timeout: return "timeout";
        case ExecutionError::AccountValidation: return "account_validation";
        case ExecutionError::SecurityViolation: return "security_violation";
    }
    return "unknown";
}

const char* to_string(TestStatus status) {
    switch (status) {
        case TestStatus::Passed: return "passed";
        case TestStatus::Failed: return "failed";
        case TestStatus::Timeout: return "timeout";
        case TestStatus::Rejected: return "rejected";
        case TestStatus::Skipped: return "skipped";
    }
    return "unknown";
}

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(FindingCategory category) {
    switch (category) {
        case FindingCategory::PerformanceIssue: return "performance_issue";
        case FindingCategory::SecurityVulnerability: return "security_vulnerability";
        case FindingCategory::TransactionError: return "transaction_error";
        case FindingCategory::LogicError: return "logic_error";
    }
    return "unknown";
}

}  // namespace chaosforge
