#pragma once
#ifndef CHAOSFORGE_CONFIG_H
#define CHAOSFORGE_CONFIG_H

#include <string>
#include <cstdint>
#include <optional>
#include <chrono>

namespace chaosforge {

struct Config {
    std::string log_level = "info";
    std::string program_id = "ChaosTarget11111111111111111111111111111111";

    // Engine
    size_t max_concurrent = 8;
    size_t worker_stack_bytes = 2 * 1024 * 1024;  // 2MB per worker
    size_t corpus_size = 256;

    // Resource pool
    uint32_t max_cpu = 8;
    uint32_t max_mem = 1024;

    // Security monitor
    std::chrono::seconds rate_limit_window{300};
    size_t max_operations_per_window = 100;
    uint64_t circuit_breaker_threshold = 50;
    std::chrono::milliseconds monitor_interval{1000};

    // Mutation
    double mutation_rate = 0.1;
    uint32_t mutation_intensity = 1;
    std::optional<uint64_t> mutation_seed;
    bool mutate_accounts = true;

    // Per-test defaults and executor limits
    uint32_t compute_budget = 200000;
    std::chrono::milliseconds timeout{5000};
    uint64_t high_cost_units = 200000;
    uint64_t critical_cost_units = 1400000;
    std::chrono::milliseconds slow_execution{200};
    size_t max_instruction_size = 1024;

    // Malformed numeric values keep their default and log a warning
    static Config from_env();

    // Throws std::invalid_argument when the core cannot run with these values
    void validate() const;
};

}  // namespace chaosforge

#endif  // CHAOSFORGE_CONFIG_H
