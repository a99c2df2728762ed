#pragma once
#ifndef CHAOSFORGE_RESOURCE_POOL_H
#define CHAOSFORGE_RESOURCE_POOL_H

#include "core/types.h"
#include <atomic>
#include <cstdint>

namespace chaosforge {

enum class AcquireResult {
    Acquired,
    InsufficientCapacity,
};

// Lock-free cpu/mem admission control. Both counters share one 64-bit word
// (cpu in the high half, mem in the low half) so a single compare-exchange
// admits both resources or neither.
class ResourcePool {
public:
    ResourcePool(uint32_t max_cpu, uint32_t max_mem);

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    // Fails fast when either resource is short; only retries a lost CAS race
    AcquireResult acquire(const ResourceProfile& profile);

    // Caller contract: profile was previously acquired from this pool
    void release(const ResourceProfile& profile);

    uint32_t available_cpu() const;
    uint32_t available_mem() const;
    uint32_t max_cpu() const { return max_cpu_; }
    uint32_t max_mem() const { return max_mem_; }

private:
    static uint64_t pack(uint32_t cpu, uint32_t mem) {
        return (static_cast<uint64_t>(cpu) << 32) | mem;
    }
    static uint32_t cpu_of(uint64_t word) { return static_cast<uint32_t>(word >> 32); }
    static uint32_t mem_of(uint64_t word) { return static_cast<uint32_t>(word); }

    const uint32_t max_cpu_;
    const uint32_t max_mem_;
    std::atomic<uint64_t> available_;
};

// Holds an acquired profile and gives it back on destruction
class ResourceLease {
public:
    ResourceLease(ResourcePool& pool, const ResourceProfile& profile);
    ~ResourceLease();

    ResourceLease(const ResourceLease&) = delete;
    ResourceLease& operator=(const ResourceLease&) = delete;
    ResourceLease(ResourceLease&& other) noexcept;
    ResourceLease& operator=(ResourceLease&& other) noexcept;

    bool acquired() const { return pool_ != nullptr; }
    explicit operator bool() const { return acquired(); }

    // Returns the capacity early; the destructor then does nothing
    void release();

private:
    ResourcePool* pool_;
    ResourceProfile profile_;
};

}  // namespace chaosforge

#endif  // CHAOSFORGE_RESOURCE_POOL_H
