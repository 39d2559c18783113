#include "execution_coordinator.hpp"
#include "event_pusher.hpp"
#include "path_catalog.hpp"
#include "risk_gate.hpp"
#include "venue_health.hpp"
#include "../data/snapshot_cache.hpp"
#include "../utils/logger.hpp"

namespace arbx {

namespace {

// Order quantities are rounded down to this many decimals.
constexpr int kQuantityDigits = 8;

ExecutionState committed_state(size_t legs_done) {
    switch (legs_done) {
        case 1: return ExecutionState::LEG1_COMMITTED;
        case 2: return ExecutionState::LEG2_COMMITTED;
        default: return ExecutionState::LEG3_COMMITTED;
    }
}

ExecutionState to_execution_state(TerminalState state) {
    switch (state) {
        case TerminalState::COMPLETED: return ExecutionState::COMPLETED;
        case TerminalState::ROLLED_BACK: return ExecutionState::ROLLED_BACK;
        case TerminalState::PARTIALLY_STRANDED: return ExecutionState::PARTIALLY_STRANDED;
    }
    return ExecutionState::PARTIALLY_STRANDED;
}

} // namespace

std::chrono::milliseconds ExecutionSettings::fill_timeout(const Venue& venue) const {
    auto it = fill_timeouts.find(venue);
    return it == fill_timeouts.end() ? default_fill_timeout : it->second;
}

ExecutionSettings ExecutionSettings::from_config(const EngineConfig& config) {
    ExecutionSettings settings;
    settings.partial_fill_tolerance_pct = config.execution.partial_fill_tolerance_pct;
    settings.fresh_book_timeout = std::chrono::milliseconds(config.execution.fresh_book_timeout_ms);
    for (const auto& [name, exchange] : config.exchanges) {
        settings.fill_timeouts[name] = std::chrono::milliseconds(exchange.fill_timeout_ms);
    }
    return settings;
}

ExecutionCoordinator::ExecutionCoordinator(const PathCatalog& catalog,
                                           OrderGateway& gateway,
                                           SnapshotCache& cache,
                                           ResourceLockTable& locks,
                                           ExecutionSettings settings,
                                           RiskGate* risk_gate,
                                           EventPusher* events,
                                           VenueHealthTracker* health)
    : catalog_(catalog),
      gateway_(gateway),
      cache_(cache),
      locks_(locks),
      risk_gate_(risk_gate),
      events_(events),
      health_(health),
      settings_(std::move(settings)) {}

void ExecutionCoordinator::set_settings(ExecutionSettings settings) {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    settings_ = std::move(settings);
}

ExecutionOutcome ExecutionCoordinator::execute(const Opportunity& opportunity, Decimal size,
                                               const Revalidate& revalidate) {
    ExecutionSettings settings;
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings = settings_;
    }

    const Path& path = catalog_.path(opportunity.path_id);
    if (!size.is_positive()) {
        return ExecutionOutcome::error({ErrorKind::INSUFFICIENT_BALANCE, "size must be positive"});
    }
    if (opportunity.snapshots.size() != path.legs.size()) {
        return ExecutionOutcome::error({ErrorKind::MISSING_DATA, "opportunity carries no books"});
    }

    const uint64_t execution_id = next_execution_id_++;
    auto lease = locks_.try_acquire(path.resources(), execution_id);
    if (!lease) {
        ARBX_LOG_DEBUG("Path {} skipped: resources busy", path.id);
        return ExecutionOutcome::error({ErrorKind::RESOURCES_BUSY, "resources of path " + std::to_string(path.id) + " are leased"});
    }

    if (revalidate && !revalidate(opportunity)) {
        ARBX_LOG_DEBUG("Path {} withdrawn before leg 1", path.id);
        return ExecutionOutcome::error({ErrorKind::WITHDRAWN, "opportunity invalidated by newer data"});
    }

    ExecutionResult result;
    result.execution_id = execution_id;
    result.path_id = path.id;
    result.start_asset = path.start_asset;
    result.expected_net_profit_pct = opportunity.net_profit_pct;
    result.start_size = size;
    result.started_at = Clock::now();
    transition(execution_id, ExecutionState::PENDING);
    ARBX_LOG_INFO("Execution {} started: {} size {} {}", execution_id, path.describe(), size.to_string(),
                  path.start_asset);

    try {
        run_legs(opportunity, path, result, settings);
    } catch (const std::exception& e) {
        // Holdings are unknown past this point: report the path stranded.
        ARBX_LOG_ERROR("Execution {} aborted: {}", execution_id, e.what());
        result.terminal_state = TerminalState::PARTIALLY_STRANDED;
        result.error = ErrorKind::REMEDIATION_FAILED;
        result.detail += (result.detail.empty() ? "" : "; ") + std::string("execution aborted: ") + e.what();
    }

    finish(result);
    return result;
}

void ExecutionCoordinator::run_legs(const Opportunity& opportunity, const Path& path, ExecutionResult& result,
                                    const ExecutionSettings& settings) {
    const uint64_t execution_id = result.execution_id;
    Decimal amount = result.start_size;
    std::vector<Holding> holdings;
    bool failed = false;

    for (size_t i = 0; i < path.legs.size(); ++i) {
        const Leg& leg = path.legs[i];
        const OrderBookSnapshot& book = opportunity.snapshots[i];
        std::string client_order_id = "arbx-" + std::to_string(execution_id) + "-L" + std::to_string(i + 1);

        LegOutcome outcome;
        try {
            Decimal quantity =
                (leg.action == OrderSide::BUY ? amount / book.best_ask : amount).truncate(kQuantityDigits);
            outcome = place_and_wait(leg, quantity, amount, client_order_id, settings);
        } catch (const std::exception& e) {
            // Nothing was placed; the leg's input stays where it is.
            outcome = LegOutcome{};
            outcome.leg = leg;
            outcome.input_amount = amount;
            outcome.status = LegStatus::REJECTED;
            outcome.message = e.what();
        }
        result.legs.push_back(outcome);

        if (outcome.status == LegStatus::FILLED) {
            amount = outcome.received_amount;
            transition(execution_id, committed_state(i + 1));
            continue;
        }

        failed = true;
        result.error = outcome.status == LegStatus::TIMED_OUT ? ErrorKind::LEG_TIMEOUT : ErrorKind::LEG_REJECTED;
        result.detail = "leg " + std::to_string(i + 1) + " " + leg.describe() + " " + to_string(outcome.status);
        if (!outcome.message.empty()) {
            result.detail += ": " + outcome.message;
        }
        transition(execution_id, ExecutionState::LEG_FAILED);
        ARBX_LOG_ERROR("Execution {} {}", execution_id, result.detail);

        // What the failed leg did not consume stays where the previous leg
        // delivered it; whatever it did fill sits on its own venue.
        Decimal unconsumed = max(amount - consumed_amount(outcome), Decimal::zero());
        if (leg.consumed() == path.start_asset) {
            result.final_amount += unconsumed;
        } else if (unconsumed.is_positive()) {
            holdings.push_back(Holding{path.legs[i - 1].venue, leg.consumed(), unconsumed});
        }
        if (outcome.received_amount.is_positive()) {
            if (leg.received() == path.start_asset) {
                result.final_amount += outcome.received_amount;
            } else {
                holdings.push_back(Holding{leg.venue, leg.received(), outcome.received_amount});
            }
        }
        break;
    }

    if (!failed) {
        result.final_amount = amount;
        result.terminal_state = TerminalState::COMPLETED;
        return;
    }

    transition(execution_id, ExecutionState::REMEDIATING);
    if (result.legs.size() == 1 && result.legs.front().filled_quantity.is_zero()) {
        // Leg 1 moved nothing; there is nothing to liquidate.
        result.terminal_state = TerminalState::ROLLED_BACK;
        return;
    }
    remediate(result, holdings, settings);
}

void ExecutionCoordinator::on_fill(const FillReport& report) {
    if (!fills_.route(report)) {
        ARBX_LOG_DEBUG("Fill report for {} arrived after its wait ended", report.client_order_id);
    }
}

LegOutcome ExecutionCoordinator::place_and_wait(const Leg& leg, Decimal quantity, Decimal input,
                                                const std::string& client_order_id,
                                                const ExecutionSettings& settings) {
    LegOutcome outcome;
    outcome.leg = leg;
    outcome.input_amount = input;
    outcome.requested_quantity = quantity;

    if (!quantity.is_positive()) {
        outcome.status = LegStatus::REJECTED;
        outcome.message = "quantity rounds to zero";
        return outcome;
    }

    auto channel = fills_.open(client_order_id);
    OrderRequest request{client_order_id, leg.venue, leg.pair, leg.action, OrderType::MARKET, quantity, std::nullopt};
    const auto placed_at = std::chrono::steady_clock::now();

    try {
        outcome.order_id = gateway_.place_order(request);
    } catch (const ExchangeException& e) {
        fills_.close(client_order_id);
        outcome.status = LegStatus::REJECTED;
        outcome.message = e.what();
        ARBX_LOG_WARN("Order {} rejected: {}", client_order_id, e.what());
        report_health(outcome, placed_at);
        return outcome;
    } catch (const std::exception& e) {
        fills_.close(client_order_id);
        outcome.status = LegStatus::REJECTED;
        outcome.message = std::string("gateway failure: ") + e.what();
        ARBX_LOG_ERROR("Order {} failed in the gateway: {}", client_order_id, e.what());
        report_health(outcome, placed_at);
        return outcome;
    }
    TradingLogger::log_order_placed(leg.venue, leg.pair.symbol(), outcome.order_id, to_string(leg.action),
                                    quantity.to_string());

    const auto timeout = settings.fill_timeout(leg.venue);
    FillWait wait = channel->wait_for(timeout);
    fills_.close(client_order_id);

    if (wait.report) {
        outcome.filled_quantity = wait.report->filled_quantity;
        outcome.average_price = wait.report->average_price;
        outcome.received_amount = wait.report->received_amount;
        if (outcome.order_id.empty()) {
            outcome.order_id = wait.report->order_id;
        }
    }

    if (!wait.final) {
        outcome.status = LegStatus::TIMED_OUT;
        outcome.message = "no final fill within " + std::to_string(timeout.count()) + "ms";
        try {
            if (!gateway_.cancel_order(leg.venue, outcome.order_id)) {
                ARBX_LOG_WARN("Cancel of {} on {} not confirmed", outcome.order_id, leg.venue);
            }
        } catch (const std::exception& e) {
            ARBX_LOG_WARN("Cancel of {} on {} failed: {}", outcome.order_id, leg.venue, e.what());
        }
        report_health(outcome, placed_at);
        return outcome;
    }

    const FillReport& report = *wait.report;
    const Decimal min_fill = quantity * (Decimal::one() - settings.partial_fill_tolerance_pct / Decimal::hundred());

    if (outcome.filled_quantity.is_positive() && outcome.filled_quantity >= min_fill) {
        outcome.status = LegStatus::FILLED;
        TradingLogger::log_order_filled(leg.venue, leg.pair.symbol(), outcome.order_id,
                                        outcome.filled_quantity.to_string(), outcome.average_price.to_string());
    } else if (outcome.filled_quantity.is_positive()) {
        outcome.status = LegStatus::PARTIAL;
        outcome.message = "filled " + outcome.filled_quantity.to_string() + " of " + quantity.to_string();
    } else {
        outcome.status = LegStatus::REJECTED;
        outcome.message = report.message.empty() ? "order closed without fills" : report.message;
    }
    report_health(outcome, placed_at);
    return outcome;
}

void ExecutionCoordinator::report_health(const LegOutcome& outcome,
                                         std::chrono::steady_clock::time_point placed_at) {
    if (health_ == nullptr) {
        return;
    }
    switch (outcome.status) {
        case LegStatus::FILLED:
        case LegStatus::PARTIAL:
            health_->record_fill(outcome.leg.venue, std::chrono::duration_cast<std::chrono::milliseconds>(
                                                        std::chrono::steady_clock::now() - placed_at));
            break;
        case LegStatus::TIMED_OUT:
            health_->record_failure(outcome.leg.venue, ErrorKind::LEG_TIMEOUT);
            break;
        case LegStatus::REJECTED:
            health_->record_failure(outcome.leg.venue, ErrorKind::LEG_REJECTED);
            break;
        case LegStatus::NOT_PLACED:
            break;
    }
}

void ExecutionCoordinator::remediate(ExecutionResult& result, const std::vector<Holding>& holdings,
                                     const ExecutionSettings& settings) {
    std::vector<std::string> problems;

    for (size_t k = 0; k < holdings.size(); ++k) {
        const Holding& holding = holdings[k];
        const std::string what = holding.amount.to_string() + " " + holding.asset + " on " + holding.venue;

        auto leg = catalog_.find_market(holding.venue, holding.asset, result.start_asset);
        if (!leg) {
            problems.push_back("no direct market for " + what);
            continue;
        }

        SnapshotRead read = cache_.wait_for_fresh(holding.venue, leg->pair, settings.fresh_book_timeout);
        if (!read.snapshot || read.snapshot->is_crossed_or_empty()) {
            problems.push_back("no usable book to liquidate " + what);
            continue;
        }
        if (!read.is_fresh()) {
            ARBX_LOG_WARN("Liquidating {} against a stale book", what);
        }

        Decimal quantity;
        try {
            quantity = (leg->action == OrderSide::BUY ? holding.amount / read.snapshot->best_ask
                                                      : holding.amount).truncate(kQuantityDigits);
        } catch (const std::exception& e) {
            problems.push_back("cannot size liquidation of " + what + ": " + e.what());
            continue;
        }
        if (!quantity.is_positive()) {
            ARBX_LOG_WARN("Leaving dust {} unliquidated", what);
            continue;
        }

        std::string client_order_id = "arbx-" + std::to_string(result.execution_id) + "-R" + std::to_string(k + 1);
        LegOutcome outcome = place_and_wait(*leg, quantity, holding.amount, client_order_id, settings);
        result.remediations.push_back(outcome);

        result.final_amount += outcome.received_amount;
        if (outcome.status != LegStatus::FILLED) {
            problems.push_back("liquidation of " + what + " " + to_string(outcome.status) +
                               (outcome.message.empty() ? "" : ": " + outcome.message));
        }
    }

    if (problems.empty()) {
        result.terminal_state = TerminalState::COMPLETED;
        result.detail += "; remediated";
        return;
    }

    result.terminal_state = TerminalState::PARTIALLY_STRANDED;
    result.error = ErrorKind::REMEDIATION_FAILED;
    for (const auto& problem : problems) {
        result.detail += "; " + problem;
    }
}

void ExecutionCoordinator::finish(ExecutionResult& result) {
    result.finished_at = Clock::now();
    result.realized_profit = result.final_amount - result.start_size;
    transition(result.execution_id, to_execution_state(result.terminal_state));

    TradingLogger::log_execution_finished(result.execution_id, result.path_id, to_string(result.terminal_state),
                                          result.realized_profit.to_string(), result.start_asset);

    if (result.terminal_state == TerminalState::PARTIALLY_STRANDED) {
        ARBX_LOG_CRITICAL("Execution {} partially stranded: {}", result.execution_id, result.detail);
        if (events_ != nullptr) {
            Alert alert;
            alert.level = Alert::Level::CRITICAL;
            alert.kind = ErrorKind::REMEDIATION_FAILED;
            alert.title = "Execution " + std::to_string(result.execution_id) + " partially stranded";
            alert.message = result.detail;
            alert.timestamp = result.finished_at;
            events_->push_event(AlertEvent{alert});
        }
        if (risk_gate_ != nullptr) {
            risk_gate_->halt_trading("execution " + std::to_string(result.execution_id) + " partially stranded");
        }
    }

    if (risk_gate_ != nullptr && result.terminal_state != TerminalState::ROLLED_BACK) {
        risk_gate_->record_realized(result.start_asset, result.realized_profit);
    }

    if (events_ != nullptr) {
        events_->push_event(ExecutionResultEvent{result});
    }
}

void ExecutionCoordinator::transition(uint64_t execution_id, ExecutionState state) {
    ARBX_LOG_DEBUG("Execution {} -> {}", execution_id, to_string(state));
    if (state_observer_) {
        state_observer_(execution_id, state);
    }
}

Decimal ExecutionCoordinator::consumed_amount(const LegOutcome& outcome) {
    if (outcome.leg.action == OrderSide::BUY) {
        return outcome.filled_quantity * outcome.average_price;
    }
    return outcome.filled_quantity;
}

} // namespace arbx
