#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "types.hpp"
#include "../utils/thread_pool.hpp"

namespace arbx {

class ConfigManager;
class PathCatalog;
class SnapshotCache;
class FeeSchedule;
class MarketContextTracker;
class RiskGate;
class ExecutionCoordinator;
class BalanceProvider;
class EventPusher;
class VenueHealthTracker;

enum class CycleOutcome {
    IN_FLIGHT,      // another cycle for the path is running
    UNEVALUABLE,
    REJECTED,       // risk gate said no
    NOT_EXECUTED,   // busy resources or withdrawn
    PAUSED,         // a venue on the path is unhealthy
    EXECUTED
};

const char* to_string(CycleOutcome outcome);

struct SchedulerStats {
    uint64_t cycles = 0;
    uint64_t unevaluable = 0;
    uint64_t rejected = 0;
    uint64_t not_executed = 0;
    uint64_t paused = 0;
    uint64_t executed = 0;
};

// Runs scan cycles for each path family on a worker pool. Snapshot updates
// trigger the paths using the updated market, subject to a per-path minimum
// spacing stretched by the volatility and venue-health slowdown factors; a
// fallback cadence per family rescans every due path and refreshes fees.
class ScanScheduler {
public:
    ScanScheduler(ConfigManager& config,
                  const PathCatalog& catalog,
                  SnapshotCache& cache,
                  FeeSchedule& fees,
                  MarketContextTracker& market,
                  RiskGate& risk_gate,
                  ExecutionCoordinator& coordinator,
                  BalanceProvider& balances,
                  EventPusher* events = nullptr,
                  VenueHealthTracker* health = nullptr);
    ~ScanScheduler();

    ScanScheduler(const ScanScheduler&) = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Snapshot-cache listener.
    void on_snapshot_update(const OrderBookSnapshot& snapshot);

    // Evaluate, admit and execute one path on the calling thread.
    CycleOutcome run_cycle(size_t path_id);

    TimePoint next_allowed_scan(size_t path_id) const;
    bool is_in_flight(size_t path_id) const;

    SchedulerStats stats() const;

private:
    class InFlightRelease;

    bool try_mark_in_flight(size_t path_id);
    void clear_in_flight(size_t path_id);
    bool is_due(size_t path_id, TimePoint now) const;
    bool schedule(size_t path_id, int priority);
    CycleOutcome scan(size_t path_id);
    BalanceSnapshot capture_balances(const Path& path);
    void dispatcher_loop(PathFamily family);
    void maintenance();

    ConfigManager& config_;
    const PathCatalog& catalog_;
    SnapshotCache& cache_;
    FeeSchedule& fees_;
    MarketContextTracker& market_;
    RiskGate& risk_gate_;
    ExecutionCoordinator& coordinator_;
    BalanceProvider& balances_;
    EventPusher* events_;
    VenueHealthTracker* health_;

    std::atomic<bool> running_{false};
    std::unique_ptr<ThreadPool> pool_;
    std::vector<std::thread> dispatchers_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;

    mutable std::mutex state_mutex_;
    std::set<size_t> in_flight_;
    std::map<size_t, TimePoint> last_scan_;

    std::mutex maintenance_mutex_;
    int64_t current_day_ = -1;

    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> unevaluable_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> not_executed_{0};
    std::atomic<uint64_t> paused_{0};
    std::atomic<uint64_t> executed_{0};
};

} // namespace arbx
