#pragma once
#ifndef CHAOSFORGE_SIMULATED_TARGET_H
#define CHAOSFORGE_SIMULATED_TARGET_H

#include "config/config.h"
#include "harness/target.h"
#include <atomic>
#include <chrono>
#include <cstdint>

namespace chaosforge {

// Deterministic in-process program. The first payload byte is the opcode:
//   0x00  succeed, requires the first account (if any) to be a signer
//   0x01  fail with custom error code payload[1]
//   0x02  burn (payload[1] << 8 | payload[2]) * 1000 compute units
//   other fail with InvalidArgument
class SimulatedTarget : public TargetProgram {
public:
    enum Opcode : uint8_t {
        kSucceed = 0x00,
        kFailCustom = 0x01,
        kBurnCompute = 0x02,
    };

    explicit SimulatedTarget(std::chrono::microseconds latency = std::chrono::microseconds{0});

    InvocationResult invoke(const std::string& program_id,
                            const std::vector<AccountRef>& accounts,
                            const std::vector<uint8_t>& payload,
                            uint32_t compute_unit_limit) override;

    uint64_t invocations() const { return invocations_.load(); }

private:
    std::chrono::microseconds latency_;
    std::atomic<uint64_t> invocations_{0};
};

// Mixed corpus exercising every opcode with matching expectations, sized by
// config.corpus_size and using the configured per-test budget and timeout
std::vector<TestCase> make_seed_corpus(const Config& config);

}  // namespace chaosforge

#endif  // CHAOSFORGE_SIMULATED_TARGET_H
