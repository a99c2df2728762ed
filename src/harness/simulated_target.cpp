#include "harness/simulated_target.h"
#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <thread>
#include <utility>

namespace chaosforge {

namespace {
constexpr uint64_t kBaseUnits = 1500;
constexpr uint64_t kUnitsPerByte = 40;
constexpr uint64_t kBurnStep = 1000;
constexpr uint32_t kSeedMem = 16;
}  // namespace

SimulatedTarget::SimulatedTarget(std::chrono::microseconds latency) : latency_(latency) {}

InvocationResult SimulatedTarget::invoke(const std::string& /*program_id*/,
                                         const std::vector<AccountRef>& accounts,
                                         const std::vector<uint8_t>& payload,
                                         uint32_t compute_unit_limit) {
    invocations_.fetch_add(1, std::memory_order_relaxed);
    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }

    uint64_t units = std::min<uint64_t>(kBaseUnits + kUnitsPerByte * payload.size(),
                                        compute_unit_limit);
    if (payload.empty()) {
        return InvocationResult::failure(ProgramError::InvalidArgument, units);
    }

    switch (payload[0]) {
        case kSucceed:
            if (!accounts.empty() && !accounts.front().is_signer) {
                return InvocationResult::failure(ProgramError::InvalidAccountData, units);
            }
            return InvocationResult::ok(units);
        case kFailCustom: {
            uint32_t code = payload.size() > 1 ? payload[1] : 0;
            return InvocationResult::failure(ProgramError::Custom, units, code);
        }
        case kBurnCompute: {
            uint64_t hi = payload.size() > 1 ? payload[1] : 0;
            uint64_t lo = payload.size() > 2 ? payload[2] : 0;
            uint64_t burned = units + ((hi << 8) | lo) * kBurnStep;
            if (burned > compute_unit_limit) {
                return InvocationResult::failure(ProgramError::ComputeBudgetExceeded,
                                                 compute_unit_limit);
            }
            return InvocationResult::ok(burned);
        }
        default:
            return InvocationResult::failure(ProgramError::InvalidArgument, units);
    }
}

std::vector<TestCase> make_seed_corpus(const Config& config) {
    std::vector<TestCase> corpus;
    corpus.reserve(config.corpus_size);

    // Sized so max_concurrent seeds fit the pool together
    uint32_t share = static_cast<uint32_t>(
        std::max<uint64_t>(1, config.max_mem / std::max<size_t>(1, config.max_concurrent)));
    ResourceProfile profile{1, std::min(kSeedMem, share)};

    for (size_t i = 0; i < config.corpus_size; ++i) {
        TestCase tc;
        tc.id = fmt::format("seed-{:04}", i);
        tc.target_accounts = {
            AccountRef{fmt::format("Payer{:039}", i), true, true},
            AccountRef{fmt::format("State{:039}", i), false, true},
        };
        tc.resources = profile;
        tc.compute_budget = config.compute_budget;
        tc.timeout = config.timeout;

        auto low = static_cast<uint8_t>(i & 0xFF);
        switch (i % 6) {
            case 0:
                tc.instruction_payload = {SimulatedTarget::kSucceed, low, 0x10, 0x20};
                break;
            case 1: {
                auto code = static_cast<uint8_t>(i % 200 + 1);
                tc.instruction_payload = {SimulatedTarget::kFailCustom, code};
                tc.expected_result = ExpectedResult::fail_with(code);
                break;
            }
            case 2:
                tc.instruction_payload = {SimulatedTarget::kBurnCompute, 0x00, 0x20};
                break;
            case 3:
                tc.instruction_payload = {0x07, low};
                tc.expected_result = ExpectedResult::revert();
                break;
            case 4:
                tc.instruction_payload = {SimulatedTarget::kFailCustom, 0xEE, low};
                tc.expected_result = ExpectedResult::revert();
                break;
            case 5:
                // 1.5M units against a raised budget
                tc.instruction_payload = {SimulatedTarget::kBurnCompute, 0x05, 0xDC};
                tc.compute_budget = 1600000;
                break;
        }
        corpus.push_back(std::move(tc));
    }
    return corpus;
}

}  // namespace chaosforge
