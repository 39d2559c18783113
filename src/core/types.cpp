#include "types.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace arbx {

const char* to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

const char* to_string(PathFamily family) {
    return family == PathFamily::CROSS_VENUE ? "cross_venue" : "triangular";
}

const char* to_string(LegStatus status) {
    switch (status) {
        case LegStatus::NOT_PLACED: return "NOT_PLACED";
        case LegStatus::FILLED: return "FILLED";
        case LegStatus::PARTIAL: return "PARTIAL";
        case LegStatus::REJECTED: return "REJECTED";
        case LegStatus::TIMED_OUT: return "TIMED_OUT";
    }
    return "UNKNOWN";
}

const char* to_string(ExecutionState state) {
    switch (state) {
        case ExecutionState::PENDING: return "Pending";
        case ExecutionState::LEG1_COMMITTED: return "Leg1Committed";
        case ExecutionState::LEG2_COMMITTED: return "Leg2Committed";
        case ExecutionState::LEG3_COMMITTED: return "Leg3Committed";
        case ExecutionState::LEG_FAILED: return "LegFailed";
        case ExecutionState::REMEDIATING: return "Remediating";
        case ExecutionState::COMPLETED: return "Completed";
        case ExecutionState::ROLLED_BACK: return "RolledBack";
        case ExecutionState::PARTIALLY_STRANDED: return "PartiallyStranded";
    }
    return "Unknown";
}

const char* to_string(TerminalState state) {
    switch (state) {
        case TerminalState::COMPLETED: return "Completed";
        case TerminalState::ROLLED_BACK: return "RolledBack";
        case TerminalState::PARTIALLY_STRANDED: return "PartiallyStranded";
    }
    return "Unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::STALE_DATA: return "StaleData";
        case ErrorKind::MISSING_DATA: return "MissingData";
        case ErrorKind::MISSING_FEE: return "MissingFee";
        case ErrorKind::BAD_BOOK: return "BadBook";
        case ErrorKind::INVALID_PATH: return "InvalidPath";
        case ErrorKind::INSUFFICIENT_DEPTH: return "InsufficientDepth";
        case ErrorKind::INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case ErrorKind::BELOW_THRESHOLD: return "BelowThreshold";
        case ErrorKind::TRADING_HALTED: return "TradingHalted";
        case ErrorKind::RESOURCES_BUSY: return "ResourcesBusy";
        case ErrorKind::WITHDRAWN: return "Withdrawn";
        case ErrorKind::LEG_TIMEOUT: return "LegTimeout";
        case ErrorKind::LEG_REJECTED: return "LegRejected";
        case ErrorKind::REMEDIATION_FAILED: return "RemediationFailed";
        case ErrorKind::VENUE_UNHEALTHY: return "VenueUnhealthy";
    }
    return "Unknown";
}

Pair Pair::parse(const std::string& symbol) {
    auto slash = symbol.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= symbol.size() ||
        symbol.find('/', slash + 1) != std::string::npos) {
        throw ValidationError("Invalid trading pair: " + symbol);
    }
    return Pair{symbol.substr(0, slash), symbol.substr(slash + 1)};
}

Decimal OrderBookSnapshot::mid() const {
    return (best_bid + best_ask) / Decimal::from_int(2);
}

Decimal OrderBookSnapshot::bid_depth_at_pct(Decimal pct) const {
    Decimal floor_price = mid() * (Decimal::one() - pct / Decimal::hundred());
    Decimal total;
    for (const auto& level : bids) {
        if (level.price < floor_price) {
            break;
        }
        total += level.quantity;
    }
    return total;
}

Decimal OrderBookSnapshot::ask_depth_at_pct(Decimal pct) const {
    Decimal ceiling_price = mid() * (Decimal::one() + pct / Decimal::hundred());
    Decimal total;
    for (const auto& level : asks) {
        if (level.price > ceiling_price) {
            break;
        }
        total += level.quantity;
    }
    return total;
}

Decimal OrderBookSnapshot::top_bid_volume(size_t levels) const {
    Decimal total;
    for (size_t i = 0; i < bids.size() && i < levels; ++i) {
        total += bids[i].quantity;
    }
    return total;
}

Decimal OrderBookSnapshot::top_ask_volume(size_t levels) const {
    Decimal total;
    for (size_t i = 0; i < asks.size() && i < levels; ++i) {
        total += asks[i].quantity;
    }
    return total;
}

std::string Leg::describe() const {
    return std::string(to_string(action)) + " " + pair.symbol() + "@" + venue;
}

std::vector<Asset> Path::assets() const {
    std::vector<Asset> result;
    for (const auto& leg : legs) {
        for (const auto* asset : {&leg.pair.base, &leg.pair.quote}) {
            if (std::find(result.begin(), result.end(), *asset) == result.end()) {
                result.push_back(*asset);
            }
        }
    }
    return result;
}

std::vector<ResourceKey> Path::resources() const {
    std::set<ResourceKey> keys;
    for (const auto& leg : legs) {
        keys.insert(ResourceKey{leg.venue, leg.pair.base});
        keys.insert(ResourceKey{leg.venue, leg.pair.quote});
    }
    return std::vector<ResourceKey>(keys.begin(), keys.end());
}

bool Path::touches(const Asset& asset) const {
    return std::any_of(legs.begin(), legs.end(),
                       [&](const Leg& leg) { return leg.pair.involves(asset); });
}

std::string Path::describe() const {
    std::ostringstream out;
    out << "#" << id << " [" << to_string(family) << "] " << start_asset;
    for (const auto& leg : legs) {
        out << " -(" << leg.describe() << ")-> " << leg.received();
    }
    return out.str();
}

bool Opportunity::operator==(const Opportunity& other) const {
    if (path_id != other.path_id || gross_profit_pct != other.gross_profit_pct ||
        net_profit_pct != other.net_profit_pct || max_safe_size != other.max_safe_size ||
        threshold_pct != other.threshold_pct || snapshot_timestamps != other.snapshot_timestamps ||
        snapshots.size() != other.snapshots.size()) {
        return false;
    }
    for (size_t i = 0; i < snapshots.size(); ++i) {
        const auto& a = snapshots[i];
        const auto& b = other.snapshots[i];
        if (a.venue != b.venue || a.pair != b.pair || a.best_bid != b.best_bid ||
            a.best_ask != b.best_ask || a.observed_at != b.observed_at) {
            return false;
        }
    }
    return true;
}

void BalanceSnapshot::set(const Venue& venue, const Asset& asset, Decimal amount) {
    for (auto& entry : entries) {
        if (entry.first.venue == venue && entry.first.asset == asset) {
            entry.second = amount;
            return;
        }
    }
    entries.emplace_back(ResourceKey{venue, asset}, amount);
}

Decimal BalanceSnapshot::available(const Venue& venue, const Asset& asset) const {
    for (const auto& entry : entries) {
        if (entry.first.venue == venue && entry.first.asset == asset) {
            return entry.second;
        }
    }
    return Decimal::zero();
}

} // namespace arbx
