#include "fuzz/mutator.h"

namespace chaosforge {

void apply_mutation(std::vector<uint8_t>& payload, MutationKind kind, size_t index,
                    std::mt19937_64& rng) {
    if (index >= payload.size()) return;

    switch (kind) {
        case MutationKind::BitFlip: {
            std::uniform_int_distribution<int> bit(0, 7);
            payload[index] ^= static_cast<uint8_t>(1u << bit(rng));
            break;
        }
        case MutationKind::ByteRepeat:
            if (index > 0) {
                payload[index] = payload[index - 1];
            }
            break;
        case MutationKind::ByteNull:
            payload[index] = 0;
            break;
        case MutationKind::ByteRandom: {
            std::uniform_int_distribution<int> byte(0, 255);
            payload[index] = static_cast<uint8_t>(byte(rng));
            break;
        }
    }
}

MutationResult mutate_tracked(const TestCase& test_case, const MutationConfig& config,
                              std::mt19937_64& rng) {
    MutationResult result{test_case, 0, false};
    auto& payload = result.test_case.instruction_payload;

    std::bernoulli_distribution should_mutate(config.mutation_rate);
    if (should_mutate(rng)) {
        std::uniform_int_distribution<int> pick_kind(0, kMutationKindCount - 1);
        for (uint32_t round = 0; round < config.intensity; ++round) {
            ++result.rounds_applied;
            if (payload.empty()) continue;
            auto kind = static_cast<MutationKind>(pick_kind(rng));
            std::uniform_int_distribution<size_t> pick_index(0, payload.size() - 1);
            apply_mutation(payload, kind, pick_index(rng), rng);
        }
    }

    // Account flags are a separate axis, applied at most once per call
    auto& accounts = result.test_case.target_accounts;
    if (config.mutate_accounts && !accounts.empty()) {
        std::uniform_int_distribution<size_t> pick_account(0, accounts.size() - 1);
        std::bernoulli_distribution coin(0.5);
        AccountRef& account = accounts[pick_account(rng)];
        if (coin(rng)) {
            account.is_signer = !account.is_signer;
            result.accounts_mutated = true;
        }
        if (coin(rng)) {
            account.is_writable = !account.is_writable;
            result.accounts_mutated = true;
        }
    }

    return result;
}

TestCase mutate(const TestCase& test_case, const MutationConfig& config,
                std::mt19937_64& rng) {
    return mutate_tracked(test_case, config, rng).test_case;
}

const char* to_string(MutationKind kind) {
    switch (kind) {
        case MutationKind::BitFlip: return "bit_flip";
        case MutationKind::ByteRepeat: return "byte_repeat";
        case MutationKind::ByteNull: return "byte_null";
        case MutationKind::ByteRandom: return "byte_random";
    }
    return "unknown";
}

}  // namespace chaosforge
