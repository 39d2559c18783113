#include "snapshot_cache.hpp"
#include "../utils/logger.hpp"

namespace arbx {

ErrorKind SnapshotRead::error_kind() const {
    switch (status) {
        case Freshness::FRESH: return ErrorKind::NONE;
        case Freshness::STALE: return ErrorKind::STALE_DATA;
        case Freshness::MISSING: return ErrorKind::MISSING_DATA;
    }
    return ErrorKind::MISSING_DATA;
}

SnapshotCache::SnapshotCache(std::chrono::milliseconds freshness_window, ClockFn clock)
    : freshness_window_ms_(freshness_window.count()),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {}

bool SnapshotCache::update(OrderBookSnapshot snapshot) {
    Entry& entry = entry_for(make_key(snapshot.venue, snapshot.pair));

    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        if (entry.snapshot && snapshot.observed_at < entry.snapshot->observed_at) {
            ARBX_LOG_TRACE("Dropping out-of-order snapshot for {}", make_key(snapshot.venue, snapshot.pair));
            return false;
        }
        entry.snapshot = snapshot;
    }
    entry.updated.notify_all();

    notify_listeners(snapshot);
    return true;
}

SnapshotRead SnapshotCache::read(const Venue& venue, const Pair& pair) const {
    const Entry* entry = find_entry(make_key(venue, pair));
    if (entry == nullptr) {
        return SnapshotRead{};
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    return classify(entry->snapshot);
}

SnapshotRead SnapshotCache::wait_for_fresh(const Venue& venue, const Pair& pair,
                                           std::chrono::milliseconds timeout) {
    Entry& entry = entry_for(make_key(venue, pair));

    std::unique_lock<std::mutex> lock(entry.mutex);
    entry.updated.wait_for(lock, timeout, [&] {
        return entry.snapshot && is_fresh(*entry.snapshot);
    });
    return classify(entry.snapshot);
}

void SnapshotCache::subscribe(UpdateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.push_back(std::move(listener));
}

void SnapshotCache::set_freshness_window(std::chrono::milliseconds window) {
    freshness_window_ms_ = window.count();
}

std::chrono::milliseconds SnapshotCache::freshness_window() const {
    return std::chrono::milliseconds(freshness_window_ms_.load());
}

size_t SnapshotCache::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return entries_.size();
}

std::vector<std::string> SnapshotCache::keys() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(key);
    }
    return result;
}

std::string SnapshotCache::make_key(const Venue& venue, const Pair& pair) {
    return venue + ":" + pair.symbol();
}

SnapshotCache::Entry& SnapshotCache::entry_for(const std::string& key) {
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    auto& slot = entries_[key];
    if (!slot) {
        slot = std::make_unique<Entry>();
    }
    return *slot;
}

const SnapshotCache::Entry* SnapshotCache::find_entry(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : it->second.get();
}

SnapshotRead SnapshotCache::classify(const std::optional<OrderBookSnapshot>& snapshot) const {
    if (!snapshot) {
        return SnapshotRead{};
    }
    return SnapshotRead{is_fresh(*snapshot) ? Freshness::FRESH : Freshness::STALE, snapshot};
}

bool SnapshotCache::is_fresh(const OrderBookSnapshot& snapshot) const {
    return clock_() - snapshot.observed_at <= freshness_window();
}

void SnapshotCache::notify_listeners(const OrderBookSnapshot& snapshot) {
    std::vector<UpdateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        try {
            listener(snapshot);
        } catch (const std::exception& e) {
            ARBX_LOG_ERROR("Snapshot listener failed for {}: {}", make_key(snapshot.venue, snapshot.pair), e.what());
        }
    }
}

} // namespace arbx
