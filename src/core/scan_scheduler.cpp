#include "scan_scheduler.hpp"
#include "event_pusher.hpp"
#include "execution_coordinator.hpp"
#include "market_context.hpp"
#include "path_catalog.hpp"
#include "profit_engine.hpp"
#include "risk_gate.hpp"
#include "venue_health.hpp"
#include "../data/fee_schedule.hpp"
#include "../data/snapshot_cache.hpp"
#include "../exchange/exchange_interface.hpp"
#include "../utils/config_manager.hpp"
#include "../utils/logger.hpp"

namespace arbx {

namespace {

int priority_of(PathFamily family) {
    return family == PathFamily::CROSS_VENUE ? 1 : 0;
}

int64_t day_index(TimePoint at) {
    return std::chrono::duration_cast<std::chrono::hours>(at.time_since_epoch()).count() / 24;
}

} // namespace

const char* to_string(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::IN_FLIGHT: return "in_flight";
        case CycleOutcome::UNEVALUABLE: return "unevaluable";
        case CycleOutcome::REJECTED: return "rejected";
        case CycleOutcome::NOT_EXECUTED: return "not_executed";
        case CycleOutcome::PAUSED: return "paused";
        case CycleOutcome::EXECUTED: return "executed";
    }
    return "unknown";
}

class ScanScheduler::InFlightRelease {
public:
    InFlightRelease(ScanScheduler& scheduler, size_t path_id) : scheduler_(scheduler), path_id_(path_id) {}
    ~InFlightRelease() { scheduler_.clear_in_flight(path_id_); }

    InFlightRelease(const InFlightRelease&) = delete;
    InFlightRelease& operator=(const InFlightRelease&) = delete;

private:
    ScanScheduler& scheduler_;
    size_t path_id_;
};

ScanScheduler::ScanScheduler(ConfigManager& config,
                             const PathCatalog& catalog,
                             SnapshotCache& cache,
                             FeeSchedule& fees,
                             MarketContextTracker& market,
                             RiskGate& risk_gate,
                             ExecutionCoordinator& coordinator,
                             BalanceProvider& balances,
                             EventPusher* events,
                             VenueHealthTracker* health)
    : config_(config),
      catalog_(catalog),
      cache_(cache),
      fees_(fees),
      market_(market),
      risk_gate_(risk_gate),
      coordinator_(coordinator),
      balances_(balances),
      events_(events),
      health_(health) {}

ScanScheduler::~ScanScheduler() {
    stop();
}

void ScanScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    auto config = config_.snapshot();
    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(config->scheduler.worker_threads));
    dispatchers_.emplace_back(&ScanScheduler::dispatcher_loop, this, PathFamily::CROSS_VENUE);
    dispatchers_.emplace_back(&ScanScheduler::dispatcher_loop, this, PathFamily::TRIANGULAR);

    ARBX_LOG_INFO("Scan scheduler started with {} workers", config->scheduler.worker_threads);
}

void ScanScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    wake_.notify_all();
    for (auto& dispatcher : dispatchers_) {
        if (dispatcher.joinable()) {
            dispatcher.join();
        }
    }
    dispatchers_.clear();

    if (pool_) {
        pool_->shutdown();
        pool_.reset();
    }
    ARBX_LOG_INFO("Scan scheduler stopped");
}

void ScanScheduler::on_snapshot_update(const OrderBookSnapshot& snapshot) {
    if (!running_) {
        return;
    }

    const TimePoint now = cache_.now();
    for (size_t path_id : catalog_.paths_using(snapshot.venue, snapshot.pair)) {
        if (is_due(path_id, now)) {
            schedule(path_id, priority_of(catalog_.path(path_id).family));
        }
    }
}

CycleOutcome ScanScheduler::run_cycle(size_t path_id) {
    if (!try_mark_in_flight(path_id)) {
        return CycleOutcome::IN_FLIGHT;
    }
    InFlightRelease release(*this, path_id);
    return scan(path_id);
}

TimePoint ScanScheduler::next_allowed_scan(size_t path_id) const {
    TimePoint last;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = last_scan_.find(path_id);
        if (it == last_scan_.end()) {
            return TimePoint{};
        }
        last = it->second;
    }

    const Path& path = catalog_.path(path_id);
    auto spacing = std::chrono::milliseconds(config_.snapshot()->scheduler.min_scan_spacing_ms);
    int factor = market_.slowdown_factor(path);
    if (health_ != nullptr) {
        factor *= health_->slowdown_factor(path);
    }
    return last + spacing * factor;
}

bool ScanScheduler::is_in_flight(size_t path_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return in_flight_.count(path_id) > 0;
}

SchedulerStats ScanScheduler::stats() const {
    SchedulerStats result;
    result.cycles = cycles_;
    result.unevaluable = unevaluable_;
    result.rejected = rejected_;
    result.not_executed = not_executed_;
    result.paused = paused_;
    result.executed = executed_;
    return result;
}

bool ScanScheduler::try_mark_in_flight(size_t path_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return in_flight_.insert(path_id).second;
}

void ScanScheduler::clear_in_flight(size_t path_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    in_flight_.erase(path_id);
}

bool ScanScheduler::is_due(size_t path_id, TimePoint now) const {
    return !is_in_flight(path_id) && now >= next_allowed_scan(path_id);
}

bool ScanScheduler::schedule(size_t path_id, int priority) {
    if (!pool_ || !try_mark_in_flight(path_id)) {
        return false;
    }

    try {
        pool_->submit_priority(priority, [this, path_id] {
            InFlightRelease release(*this, path_id);
            if (!running_) {
                return;
            }
            try {
                scan(path_id);
            } catch (const std::exception& e) {
                ARBX_LOG_ERROR("Scan of path {} failed: {}", path_id, e.what());
            }
        });
    } catch (const std::runtime_error& e) {
        // Pool already stopped
        clear_in_flight(path_id);
        ARBX_LOG_DEBUG("Path {} not scheduled: {}", path_id, e.what());
        return false;
    }
    return true;
}

CycleOutcome ScanScheduler::scan(size_t path_id) {
    const auto config = config_.snapshot();
    const Path& path = catalog_.path(path_id);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_scan_[path_id] = cache_.now();
    }
    ++cycles_;

    if (health_ != nullptr && health_->is_paused(path)) {
        ++paused_;
        ARBX_LOG_DEBUG("Path {} paused: unhealthy venue", path_id);
        return CycleOutcome::PAUSED;
    }

    auto evaluation = ProfitEngine::evaluate(path, cache_, fees_, config->profit.assumed_slippage_pct);
    if (evaluation.is_error()) {
        ++unevaluable_;
        ARBX_LOG_DEBUG("Path {} unevaluable: {} ({})", path_id, to_string(evaluation.error().kind),
                       evaluation.error().detail);
        return CycleOutcome::UNEVALUABLE;
    }

    Opportunity opportunity = evaluation.value();
    if (events_ != nullptr) {
        events_->push_event(OpportunityEvent{opportunity, path.describe()});
    }

    MarketContext context = market_.context_for(path, opportunity, capture_balances(path));
    Admission admission = risk_gate_.admit(opportunity, context, config->risk);
    if (!admission.accepted) {
        ++rejected_;
        ARBX_LOG_DEBUG("Path {} rejected: {} ({})", path_id, to_string(admission.reason), admission.detail);
        return CycleOutcome::REJECTED;
    }

    opportunity.max_safe_size = admission.size_cap;
    opportunity.threshold_pct = admission.threshold_pct;
    TradingLogger::log_opportunity(path_id, path.describe(), opportunity.gross_profit_pct.to_string(),
                                   opportunity.net_profit_pct.to_string());

    const Decimal slippage = config->profit.assumed_slippage_pct;
    auto revalidate = [this, &path, slippage](const Opportunity& admitted) {
        auto again = ProfitEngine::evaluate(path, cache_, fees_, slippage);
        return again.is_success() && again.value().net_profit_pct >= admitted.threshold_pct;
    };

    auto outcome = coordinator_.execute(opportunity, admission.size_cap, revalidate);
    if (outcome.is_error()) {
        ++not_executed_;
        ARBX_LOG_DEBUG("Path {} not executed: {} ({})", path_id, to_string(outcome.error().kind),
                       outcome.error().detail);
        return CycleOutcome::NOT_EXECUTED;
    }

    ++executed_;
    return CycleOutcome::EXECUTED;
}

BalanceSnapshot ScanScheduler::capture_balances(const Path& path) {
    BalanceSnapshot snapshot;
    for (const auto& resource : path.resources()) {
        try {
            snapshot.set(resource.venue, resource.asset, balances_.available(resource.venue, resource.asset));
        } catch (const ExchangeException& e) {
            ARBX_LOG_WARN("Balance of {} unavailable, counting zero: {}", resource.to_string(), e.what());
            snapshot.set(resource.venue, resource.asset, Decimal::zero());
        }
    }
    return snapshot;
}

void ScanScheduler::dispatcher_loop(PathFamily family) {
    const auto path_ids = catalog_.paths_for_family(family);
    ARBX_LOG_DEBUG("Dispatcher for {} paths started ({} paths)", to_string(family), path_ids.size());

    while (running_) {
        maintenance();

        const TimePoint now = cache_.now();
        size_t scheduled = 0;
        for (size_t path_id : path_ids) {
            if (!running_) {
                break;
            }
            if (is_due(path_id, now) && schedule(path_id, priority_of(family))) {
                ++scheduled;
            }
        }
        ARBX_LOG_TRACE("Fallback pass for {} scheduled {} paths", to_string(family), scheduled);

        const auto config = config_.snapshot();
        auto interval = std::chrono::milliseconds(family == PathFamily::CROSS_VENUE
                                                      ? config->scheduler.cross_venue_interval_ms
                                                      : config->scheduler.triangular_interval_ms);

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, interval, [this] { return !running_; });
    }
}

void ScanScheduler::maintenance() {
    std::unique_lock<std::mutex> lock(maintenance_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }

    const auto config = config_.snapshot();
    const TimePoint now = Clock::now();

    if (fees_.refresh_due(now, std::chrono::milliseconds(config->fees.refresh_interval_ms))) {
        fees_.refresh();
    }

    int64_t today = day_index(now);
    if (current_day_ != today) {
        if (current_day_ >= 0) {
            ARBX_LOG_INFO("New trading day, resetting daily loss counters");
            risk_gate_.reset_daily();
        }
        current_day_ = today;
    }

    cache_.set_freshness_window(std::chrono::milliseconds(config->scheduler.freshness_window_ms));
    coordinator_.set_settings(ExecutionSettings::from_config(*config));
    if (health_ != nullptr) {
        health_->configure(config->health);
    }
    market_.configure(static_cast<size_t>(config->risk.volatility_window), config->risk.volatility_band_pct,
                      static_cast<size_t>(config->risk.depth_levels));
}

} // namespace arbx
