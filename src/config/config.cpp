#include "config/config.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace chaosforge {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return nullptr;
    return value;
}

template <typename T>
void read_unsigned(const char* name, T& out) {
    const char* raw = env(name);
    if (!raw) return;
    try {
        size_t consumed = 0;
        std::string text(raw);
        if (text.front() == '-') throw std::invalid_argument("negative");
        unsigned long long parsed = std::stoull(text, &consumed);
        if (consumed != text.size()) throw std::invalid_argument("trailing characters");
        if (parsed > std::numeric_limits<T>::max()) throw std::out_of_range("too large");
        out = static_cast<T>(parsed);
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring {}='{}' ({}), keeping {}", name, raw, e.what(), out);
    }
}

void read_double(const char* name, double& out) {
    const char* raw = env(name);
    if (!raw) return;
    try {
        size_t consumed = 0;
        std::string text(raw);
        double parsed = std::stod(text, &consumed);
        if (consumed != text.size()) throw std::invalid_argument("trailing characters");
        out = parsed;
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring {}='{}' ({}), keeping {}", name, raw, e.what(), out);
    }
}

void read_bool(const char* name, bool& out) {
    const char* raw = env(name);
    if (!raw) return;
    std::string text(raw);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        out = true;
    } else if (text == "0" || text == "false" || text == "no" || text == "off") {
        out = false;
    } else {
        spdlog::warn("Ignoring {}='{}', keeping {}", name, raw, out);
    }
}

// Accepts a plain byte count or a k/m/g suffixed size
void read_size(const char* name, size_t& out) {
    const char* raw = env(name);
    if (!raw) return;
    std::string text(raw);
    size_t multiplier = 1;
    switch (text.back()) {
        case 'k': case 'K': multiplier = 1024; text.pop_back(); break;
        case 'm': case 'M': multiplier = 1024 * 1024; text.pop_back(); break;
        case 'g': case 'G': multiplier = 1024 * 1024 * 1024; text.pop_back(); break;
        default: break;
    }
    try {
        size_t consumed = 0;
        if (text.empty() || text.front() == '-') throw std::invalid_argument("not a size");
        unsigned long long parsed = std::stoull(text, &consumed);
        if (consumed != text.size()) throw std::invalid_argument("trailing characters");
        if (parsed > std::numeric_limits<size_t>::max() / multiplier) {
            throw std::out_of_range("too large");
        }
        out = static_cast<size_t>(parsed) * multiplier;
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring {}='{}' ({}), keeping {}", name, raw, e.what(), out);
    }
}

}  // namespace

Config Config::from_env() {
    Config cfg;

    if (const char* level = env("CHAOSFORGE_LOG_LEVEL")) {
        cfg.log_level = level;
    }
    if (const char* program = env("CHAOSFORGE_PROGRAM_ID")) {
        cfg.program_id = program;
    }

    read_unsigned("CHAOSFORGE_MAX_CONCURRENT", cfg.max_concurrent);
    read_size("CHAOSFORGE_WORKER_STACK_SIZE", cfg.worker_stack_bytes);
    read_unsigned("CHAOSFORGE_CORPUS_SIZE", cfg.corpus_size);
    read_unsigned("CHAOSFORGE_MAX_CPU", cfg.max_cpu);
    read_unsigned("CHAOSFORGE_MAX_MEM", cfg.max_mem);

    uint64_t window_secs = static_cast<uint64_t>(cfg.rate_limit_window.count());
    read_unsigned("CHAOSFORGE_RATE_LIMIT_WINDOW_SECS", window_secs);
    cfg.rate_limit_window = std::chrono::seconds(window_secs);
    read_unsigned("CHAOSFORGE_MAX_OPERATIONS_PER_WINDOW", cfg.max_operations_per_window);
    read_unsigned("CHAOSFORGE_CIRCUIT_BREAKER_THRESHOLD", cfg.circuit_breaker_threshold);
    uint64_t interval_ms = static_cast<uint64_t>(cfg.monitor_interval.count());
    read_unsigned("CHAOSFORGE_MONITOR_INTERVAL_MS", interval_ms);
    cfg.monitor_interval = std::chrono::milliseconds(interval_ms);

    read_double("CHAOSFORGE_MUTATION_RATE", cfg.mutation_rate);
    read_unsigned("CHAOSFORGE_MUTATION_INTENSITY", cfg.mutation_intensity);
    if (env("CHAOSFORGE_MUTATION_SEED")) {
        uint64_t seed = 0;
        read_unsigned("CHAOSFORGE_MUTATION_SEED", seed);
        cfg.mutation_seed = seed;
    }
    read_bool("CHAOSFORGE_MUTATE_ACCOUNTS", cfg.mutate_accounts);

    read_unsigned("CHAOSFORGE_COMPUTE_BUDGET", cfg.compute_budget);
    uint64_t timeout_ms = static_cast<uint64_t>(cfg.timeout.count());
    read_unsigned("CHAOSFORGE_TIMEOUT_MS", timeout_ms);
    cfg.timeout = std::chrono::milliseconds(timeout_ms);
    read_unsigned("CHAOSFORGE_HIGH_COST_UNITS", cfg.high_cost_units);
    read_unsigned("CHAOSFORGE_CRITICAL_COST_UNITS", cfg.critical_cost_units);
    uint64_t slow_ms = static_cast<uint64_t>(cfg.slow_execution.count());
    read_unsigned("CHAOSFORGE_SLOW_EXECUTION_MS", slow_ms);
    cfg.slow_execution = std::chrono::milliseconds(slow_ms);
    read_unsigned("CHAOSFORGE_MAX_INSTRUCTION_SIZE", cfg.max_instruction_size);

    return cfg;
}

void Config::validate() const {
    if (max_concurrent == 0) {
        throw std::invalid_argument("max_concurrent must be at least 1");
    }
    if (max_cpu == 0 || max_mem == 0) {
        throw std::invalid_argument("resource pool capacity must be non-zero");
    }
    if (!(mutation_rate >= 0.0 && mutation_rate <= 1.0)) {
        throw std::invalid_argument("mutation_rate must be within [0, 1]");
    }
    if (rate_limit_window.count() <= 0 || max_operations_per_window == 0) {
        throw std::invalid_argument("rate limiter window and operation limit must be non-zero");
    }
    if (monitor_interval.count() <= 0) {
        throw std::invalid_argument("monitor_interval must be positive");
    }
    if (critical_cost_units < high_cost_units) {
        throw std::invalid_argument("critical_cost_units must not be below high_cost_units");
    }
}

}  // namespace chaosforge
