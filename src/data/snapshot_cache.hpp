#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "../core/types.hpp"

namespace arbx {

enum class Freshness {
    FRESH,
    STALE,
    MISSING
};

struct SnapshotRead {
    Freshness status = Freshness::MISSING;
    std::optional<OrderBookSnapshot> snapshot;

    bool is_fresh() const { return status == Freshness::FRESH; }

    // STALE_DATA / MISSING_DATA for unusable reads, NONE otherwise.
    ErrorKind error_kind() const;
};

// Latest order book per (venue, pair). The map itself is guarded by a
// reader/writer lock taken exclusively only to create a new key; each key
// has its own mutex, so writers to different keys never contend.
class SnapshotCache {
public:
    using ClockFn = std::function<TimePoint()>;
    using UpdateListener = std::function<void(const OrderBookSnapshot&)>;

    explicit SnapshotCache(std::chrono::milliseconds freshness_window, ClockFn clock = nullptr);

    SnapshotCache(const SnapshotCache&) = delete;
    SnapshotCache& operator=(const SnapshotCache&) = delete;

    // Returns false when the snapshot is older than the stored one.
    bool update(OrderBookSnapshot snapshot);

    SnapshotRead read(const Venue& venue, const Pair& pair) const;

    // Blocks until a fresh snapshot exists for the key or `timeout` elapses.
    SnapshotRead wait_for_fresh(const Venue& venue, const Pair& pair, std::chrono::milliseconds timeout);

    // Listeners run on the updating thread after the locks are released.
    void subscribe(UpdateListener listener);

    void set_freshness_window(std::chrono::milliseconds window);
    std::chrono::milliseconds freshness_window() const;

    TimePoint now() const { return clock_(); }

    size_t size() const;
    std::vector<std::string> keys() const;

    static std::string make_key(const Venue& venue, const Pair& pair);

private:
    struct Entry {
        mutable std::mutex mutex;
        std::condition_variable updated;
        std::optional<OrderBookSnapshot> snapshot;
    };

    Entry& entry_for(const std::string& key);
    const Entry* find_entry(const std::string& key) const;
    SnapshotRead classify(const std::optional<OrderBookSnapshot>& snapshot) const;
    bool is_fresh(const OrderBookSnapshot& snapshot) const;
    void notify_listeners(const OrderBookSnapshot& snapshot);

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;

    std::mutex listener_mutex_;
    std::vector<UpdateListener> listeners_;

    std::atomic<int64_t> freshness_window_ms_;
    ClockFn clock_;
};

} // namespace arbx
