#pragma once
#ifndef CHAOSFORGE_MUTATOR_H
#define CHAOSFORGE_MUTATOR_H

#include "core/types.h"
#include <cstdint>
#include <random>
#include <vector>

namespace chaosforge {

enum class MutationKind {
    BitFlip,     // flip one random bit of the byte
    ByteRepeat,  // copy the previous byte, no-op at index 0
    ByteNull,
    ByteRandom,
};

inline constexpr int kMutationKindCount = 4;

struct MutationConfig {
    double mutation_rate = 0.1;  // probability that a call mutates the payload
    uint32_t intensity = 1;      // rounds applied when it does
    bool mutate_accounts = true;
};

struct MutationResult {
    TestCase test_case;
    uint32_t rounds_applied = 0;
    bool accounts_mutated = false;
};

// Produces a perturbed copy of a test case. The input is never modified and
// the same generator state always yields the same output.
MutationResult mutate_tracked(const TestCase& test_case, const MutationConfig& config,
                              std::mt19937_64& rng);

TestCase mutate(const TestCase& test_case, const MutationConfig& config,
                std::mt19937_64& rng);

// Applies one mutation at index. Out-of-range indices and empty payloads are
// left untouched.
void apply_mutation(std::vector<uint8_t>& payload, MutationKind kind, size_t index,
                    std::mt19937_64& rng);

const char* to_string(MutationKind kind);

}  // namespace chaosforge

#endif  // CHAOSFORGE_MUTATOR_H
