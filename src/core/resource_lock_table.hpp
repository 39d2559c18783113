#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

namespace arbx {

class ResourceLockTable;

// Holds a set of (venue, asset) resources until destroyed or released.
class LockLease {
public:
    LockLease() = default;
    LockLease(ResourceLockTable* table, uint64_t owner, std::vector<ResourceKey> resources);
    ~LockLease();

    LockLease(const LockLease&) = delete;
    LockLease& operator=(const LockLease&) = delete;
    LockLease(LockLease&& other) noexcept;
    LockLease& operator=(LockLease&& other) noexcept;

    void release();

    bool is_held() const { return table_ != nullptr; }
    uint64_t owner() const { return owner_; }
    const std::vector<ResourceKey>& resources() const { return resources_; }

private:
    ResourceLockTable* table_ = nullptr;
    uint64_t owner_ = 0;
    std::vector<ResourceKey> resources_;
};

// Exclusive per-(venue, asset) capital leases. Acquisition is all or
// nothing and never waits.
class ResourceLockTable {
public:
    std::optional<LockLease> try_acquire(const std::vector<ResourceKey>& resources, uint64_t owner);

    bool is_locked(const ResourceKey& resource) const;
    bool is_asset_locked(const Asset& asset) const;
    std::vector<ResourceKey> locked_resources() const;
    size_t locked_count() const;

private:
    friend class LockLease;
    void release(uint64_t owner, const std::vector<ResourceKey>& resources);

    mutable std::mutex mutex_;
    std::map<ResourceKey, uint64_t> owners_;
};

} // namespace arbx
