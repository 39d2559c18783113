#include "resource_lock_table.hpp"

namespace arbx {

LockLease::LockLease(ResourceLockTable* table, uint64_t owner, std::vector<ResourceKey> resources)
    : table_(table), owner_(owner), resources_(std::move(resources)) {}

LockLease::~LockLease() {
    release();
}

LockLease::LockLease(LockLease&& other) noexcept
    : table_(other.table_), owner_(other.owner_), resources_(std::move(other.resources_)) {
    other.table_ = nullptr;
}

LockLease& LockLease::operator=(LockLease&& other) noexcept {
    if (this != &other) {
        release();
        table_ = other.table_;
        owner_ = other.owner_;
        resources_ = std::move(other.resources_);
        other.table_ = nullptr;
    }
    return *this;
}

void LockLease::release() {
    if (table_ != nullptr) {
        table_->release(owner_, resources_);
        table_ = nullptr;
    }
}

std::optional<LockLease> ResourceLockTable::try_acquire(const std::vector<ResourceKey>& resources, uint64_t owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& resource : resources) {
        if (owners_.count(resource) > 0) {
            return std::nullopt;
        }
    }
    for (const auto& resource : resources) {
        owners_[resource] = owner;
    }
    return std::optional<LockLease>(std::in_place, this, owner, resources);
}

bool ResourceLockTable::is_locked(const ResourceKey& resource) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.count(resource) > 0;
}

bool ResourceLockTable::is_asset_locked(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [resource, owner] : owners_) {
        if (resource.asset == asset) {
            return true;
        }
    }
    return false;
}

std::vector<ResourceKey> ResourceLockTable::locked_resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceKey> result;
    result.reserve(owners_.size());
    for (const auto& [resource, owner] : owners_) {
        result.push_back(resource);
    }
    return result;
}

size_t ResourceLockTable::locked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.size();
}

void ResourceLockTable::release(uint64_t owner, const std::vector<ResourceKey>& resources) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& resource : resources) {
        auto it = owners_.find(resource);
        if (it != owners_.end() && it->second == owner) {
            owners_.erase(it);
        }
    }
}

} // namespace arbx
