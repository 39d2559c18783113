#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "fill_channel.hpp"
#include "resource_lock_table.hpp"
#include "result.hpp"
#include "types.hpp"
#include "../exchange/exchange_interface.hpp"
#include "../utils/config_types.hpp"

namespace arbx {

class PathCatalog;
class SnapshotCache;
class RiskGate;
class EventPusher;
class VenueHealthTracker;

struct ExecutionSettings {
    std::chrono::milliseconds default_fill_timeout{30000};
    std::map<Venue, std::chrono::milliseconds> fill_timeouts;
    Decimal partial_fill_tolerance_pct = Decimal::from_string("0.5");
    std::chrono::milliseconds fresh_book_timeout{2000};

    std::chrono::milliseconds fill_timeout(const Venue& venue) const;

    static ExecutionSettings from_config(const EngineConfig& config);
};

struct ExecutionRejection {
    ErrorKind kind = ErrorKind::NONE;
    std::string detail;
};

using ExecutionOutcome = Result<ExecutionResult, ExecutionRejection>;

// Commits an admitted opportunity leg by leg. Every (venue, asset) the path
// touches is leased for the whole execution; legs are placed strictly in
// order, each waiting on its own fill channel; a failure after capital moved
// is remediated by liquidating non-start holdings back into the start asset.
class ExecutionCoordinator : public FillListener {
public:
    // Returns false to withdraw the opportunity before leg 1.
    using Revalidate = std::function<bool(const Opportunity&)>;
    using StateObserver = std::function<void(uint64_t execution_id, ExecutionState state)>;

    ExecutionCoordinator(const PathCatalog& catalog,
                         OrderGateway& gateway,
                         SnapshotCache& cache,
                         ResourceLockTable& locks,
                         ExecutionSettings settings,
                         RiskGate* risk_gate = nullptr,
                         EventPusher* events = nullptr,
                         VenueHealthTracker* health = nullptr);

    ExecutionOutcome execute(const Opportunity& opportunity, Decimal size, const Revalidate& revalidate = nullptr);

    void on_fill(const FillReport& report) override;

    bool is_asset_locked(const Asset& asset) const { return locks_.is_asset_locked(asset); }
    std::vector<ResourceKey> locked_resources() const { return locks_.locked_resources(); }

    void set_settings(ExecutionSettings settings);
    void set_state_observer(StateObserver observer) { state_observer_ = std::move(observer); }

private:
    struct Holding {
        Venue venue;
        Asset asset;
        Decimal amount;
    };

    void run_legs(const Opportunity& opportunity, const Path& path, ExecutionResult& result,
                  const ExecutionSettings& settings);
    LegOutcome place_and_wait(const Leg& leg, Decimal quantity, Decimal input,
                              const std::string& client_order_id, const ExecutionSettings& settings);
    void report_health(const LegOutcome& outcome, std::chrono::steady_clock::time_point placed_at);
    void remediate(ExecutionResult& result, const std::vector<Holding>& holdings, const ExecutionSettings& settings);
    void finish(ExecutionResult& result);
    void transition(uint64_t execution_id, ExecutionState state);

    static Decimal consumed_amount(const LegOutcome& outcome);

    const PathCatalog& catalog_;
    OrderGateway& gateway_;
    SnapshotCache& cache_;
    ResourceLockTable& locks_;
    RiskGate* risk_gate_;
    EventPusher* events_;
    VenueHealthTracker* health_;

    mutable std::mutex settings_mutex_;
    ExecutionSettings settings_;

    FillRouter fills_;
    StateObserver state_observer_;
    std::atomic<uint64_t> next_execution_id_{1};
};

} // namespace arbx
