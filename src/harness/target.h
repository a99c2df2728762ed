#pragma once
#ifndef CHAOSFORGE_TARGET_H
#define CHAOSFORGE_TARGET_H

#include "core/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace chaosforge {

enum class ProgramError {
    Custom,
    InvalidArgument,
    InvalidAccountData,
    InsufficientFunds,
    AccountAlreadyInitialized,
    ComputeBudgetExceeded,
};

struct InvocationResult {
    bool success = true;
    ProgramError error = ProgramError::Custom;  // meaningful only when !success
    uint32_t code = 0;                          // carried by ProgramError::Custom
    uint64_t compute_units = 0;

    static InvocationResult ok(uint64_t units) {
        return InvocationResult{true, ProgramError::Custom, 0, units};
    }
    static InvocationResult failure(ProgramError error, uint64_t units, uint32_t code = 0) {
        return InvocationResult{false, error, code, units};
    }
};

// The program under test. Invoked concurrently from every engine worker.
class TargetProgram {
public:
    virtual ~TargetProgram() = default;

    virtual InvocationResult invoke(const std::string& program_id,
                                    const std::vector<AccountRef>& accounts,
                                    const std::vector<uint8_t>& payload,
                                    uint32_t compute_unit_limit) = 0;
};

const char* to_string(ProgramError error);

}  // namespace chaosforge

#endif  // CHAOSFORGE_TARGET_H
