#include "resources/resource_pool.h"

namespace chaosforge {

ResourcePool::ResourcePool(uint32_t max_cpu, uint32_t max_mem)
    : max_cpu_(max_cpu), max_mem_(max_mem), available_(pack(max_cpu, max_mem)) {}

AcquireResult ResourcePool::acquire(const ResourceProfile& profile) {
    uint64_t observed = available_.load(std::memory_order_acquire);
    while (true) {
        uint32_t cpu = cpu_of(observed);
        uint32_t mem = mem_of(observed);
        if (cpu < profile.cpu || mem < profile.mem) {
            return AcquireResult::InsufficientCapacity;
        }
        uint64_t desired = pack(cpu - profile.cpu, mem - profile.mem);
        // On failure observed is reloaded and the capacity check runs again
        if (available_.compare_exchange_weak(observed, desired,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire)) {
            return AcquireResult::Acquired;
        }
    }
}

void ResourcePool::release(const ResourceProfile& profile) {
    // Neither half can carry into the other while the caller contract holds
    available_.fetch_add(pack(profile.cpu, profile.mem), std::memory_order_acq_rel);
}

uint32_t ResourcePool::available_cpu() const {
    return cpu_of(available_.load(std::memory_order_acquire));
}

uint32_t ResourcePool::available_mem() const {
    return mem_of(available_.load(std::memory_order_acquire));
}

ResourceLease::ResourceLease(ResourcePool& pool, const ResourceProfile& profile)
    : pool_(nullptr), profile_(profile) {
    if (pool.acquire(profile) == AcquireResult::Acquired) {
        pool_ = &pool;
    }
}

ResourceLease::~ResourceLease() {
    release();
}

ResourceLease::ResourceLease(ResourceLease&& other) noexcept
    : pool_(other.pool_), profile_(other.profile_) {
    other.pool_ = nullptr;
}

ResourceLease& ResourceLease::operator=(ResourceLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        profile_ = other.profile_;
        other.pool_ = nullptr;
    }
    return *this;
}

void ResourceLease::release() {
    if (pool_) {
        pool_->release(profile_);
        pool_ = nullptr;
    }
}

}  // namespace chaosforge
