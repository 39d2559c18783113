#include "risk_gate.hpp"
#include "path_catalog.hpp"
#include "../utils/logger.hpp"

namespace arbx {

namespace {

// Sizes are rounded down to this many decimals.
constexpr int kSizeDigits = 8;

std::optional<Decimal> lookup(const std::map<std::string, Decimal>& values, const Asset& asset) {
    auto it = values.find(asset);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

RiskGate::RiskGate(const PathCatalog& catalog, RiskConfig config)
    : catalog_(catalog), config_(std::move(config)) {}

void RiskGate::set_config(RiskConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
}

Admission RiskGate::admit(const Opportunity& opportunity, const MarketContext& context) const {
    RiskConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
    }
    return admit(opportunity, context, config);
}

Admission RiskGate::admit(const Opportunity& opportunity, const MarketContext& context,
                          const RiskConfig& config) const {
    if (halted_) {
        return Admission::reject(ErrorKind::TRADING_HALTED, "trading halted: " + halt_reason());
    }

    const Decimal threshold = dynamic_threshold(context, config);
    if (opportunity.net_profit_pct < threshold) {
        return Admission::reject(ErrorKind::BELOW_THRESHOLD,
                                 "net " + opportunity.net_profit_pct.to_string() + "% below threshold " +
                                 threshold.to_string() + "%", threshold);
    }

    const Path& path = catalog_.path(opportunity.path_id);
    if (opportunity.snapshots.size() != path.legs.size()) {
        return Admission::reject(ErrorKind::MISSING_DATA, "opportunity carries no books", threshold);
    }
    const auto ratios = leg_ratios(path, opportunity);

    // Capital
    const Leg& first = path.legs.front();
    Decimal size = context.balances.available(first.venue, path.start_asset);
    std::string limiting = "balance of " + path.start_asset + " on " + first.venue;

    if (auto max_size = lookup(config.max_trade_size, path.start_asset); max_size && *max_size < size) {
        size = *max_size;
        limiting = "max trade size";
    }

    for (size_t i = 1; i < path.legs.size(); ++i) {
        const Leg& leg = path.legs[i];
        if (leg.venue == path.legs[i - 1].venue) {
            continue;
        }
        Decimal balance = context.balances.available(leg.venue, leg.consumed());
        Decimal bound = balance / ratios[i].input;
        if (bound < size) {
            size = bound;
            limiting = "balance of " + leg.consumed() + " on " + leg.venue;
        }
    }
    size = size.truncate(kSizeDigits);

    const Decimal min_size = lookup(config.min_trade_size, path.start_asset).value_or(Decimal::zero());
    if (!size.is_positive() || size < min_size) {
        return Admission::reject(ErrorKind::INSUFFICIENT_BALANCE,
                                 "size " + size.to_string() + " limited by " + limiting, threshold);
    }

    // Depth: each leg's top-N volume must cover depth_multiple x its quantity.
    const size_t levels = static_cast<size_t>(config.depth_levels);
    for (size_t i = 0; i < path.legs.size(); ++i) {
        const Leg& leg = path.legs[i];
        const OrderBookSnapshot& book = opportunity.snapshots[i];
        Decimal volume = leg.action == OrderSide::BUY ? book.top_ask_volume(levels) : book.top_bid_volume(levels);
        Decimal required = config.depth_multiple * size * ratios[i].base_quantity;
        if (volume >= required) {
            continue;
        }
        Decimal fitted = (volume / (config.depth_multiple * ratios[i].base_quantity)).truncate(kSizeDigits);
        ARBX_LOG_DEBUG("Path {} leg {} depth {} covers {}x only up to size {}", path.id, i + 1,
                       volume.to_string(), config.depth_multiple.to_string(), fitted.to_string());
        size = fitted;
    }

    if (!size.is_positive() || size < min_size) {
        return Admission::reject(ErrorKind::INSUFFICIENT_DEPTH,
                                 "depth supports only " + size.to_string() + " " + path.start_asset, threshold);
    }

    return Admission::accept(size, threshold);
}

Decimal RiskGate::dynamic_threshold(const MarketContext& context, const RiskConfig& config) {
    Decimal threshold = config.base_threshold_pct +
                        config.volatility_sensitivity * context.volatility_pct +
                        config.imbalance_sensitivity * context.imbalance.abs();
    return min(max(threshold, config.min_threshold_pct), config.max_threshold_pct);
}

void RiskGate::record_realized(const Asset& asset, Decimal pnl) {
    if (!pnl.is_negative()) {
        return;
    }

    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Decimal& loss = daily_loss_[asset];
        loss += pnl.abs();

        auto limit = lookup(config_.max_daily_loss, asset);
        if (limit && loss > *limit) {
            reason = "daily loss " + loss.to_string() + " " + asset + " exceeds limit " + limit->to_string();
        }
    }

    if (!reason.empty()) {
        TradingLogger::log_risk_alert("DAILY_LOSS_LIMIT", reason);
        halt_trading(reason);
    }
}

Decimal RiskGate::daily_loss(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = daily_loss_.find(asset);
    return it == daily_loss_.end() ? Decimal::zero() : it->second;
}

void RiskGate::reset_daily() {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_loss_.clear();
}

void RiskGate::halt_trading(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        halt_reason_ = reason;
    }
    halted_ = true;
    ARBX_LOG_CRITICAL("Trading halted: {}", reason);
}

void RiskGate::resume_trading() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        halt_reason_.clear();
    }
    halted_ = false;
    ARBX_LOG_WARN("Trading resumed");
}

std::string RiskGate::halt_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return halt_reason_;
}

std::vector<RiskGate::LegRatios> RiskGate::leg_ratios(const Path& path, const Opportunity& opportunity) const {
    std::vector<LegRatios> ratios;
    ratios.reserve(path.legs.size());

    Decimal amount = Decimal::one();
    for (size_t i = 0; i < path.legs.size(); ++i) {
        const Leg& leg = path.legs[i];
        const OrderBookSnapshot& book = opportunity.snapshots[i];
        Decimal base_quantity = leg.action == OrderSide::BUY ? amount / book.best_ask : amount;
        ratios.push_back(LegRatios{amount, base_quantity});
        amount = leg.action == OrderSide::BUY ? base_quantity : amount * book.best_bid;
    }
    return ratios;
}

} // namespace arbx
