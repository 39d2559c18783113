#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "decimal.hpp"

namespace arbx {

using Asset = std::string;
using Venue = std::string;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class OrderType {
    LIMIT,
    MARKET
};

enum class OrderSide {
    BUY,
    SELL
};

enum class OrderStatus {
    PENDING,
    NEW,
    PARTIAL,
    FILLED,
    CANCELLED,
    REJECTED
};

enum class PathFamily {
    CROSS_VENUE,
    TRIANGULAR
};

enum class LegStatus {
    NOT_PLACED,
    FILLED,
    PARTIAL,
    REJECTED,
    TIMED_OUT
};

enum class ExecutionState {
    PENDING,
    LEG1_COMMITTED,
    LEG2_COMMITTED,
    LEG3_COMMITTED,
    LEG_FAILED,
    REMEDIATING,
    COMPLETED,
    ROLLED_BACK,
    PARTIALLY_STRANDED
};

enum class TerminalState {
    COMPLETED,
    ROLLED_BACK,
    PARTIALLY_STRANDED
};

// Failure taxonomy shared by evaluation, admission and execution.
enum class ErrorKind {
    NONE,
    STALE_DATA,
    MISSING_DATA,
    MISSING_FEE,
    BAD_BOOK,
    INVALID_PATH,
    INSUFFICIENT_DEPTH,
    INSUFFICIENT_BALANCE,
    BELOW_THRESHOLD,
    TRADING_HALTED,
    RESOURCES_BUSY,
    WITHDRAWN,
    LEG_TIMEOUT,
    LEG_REJECTED,
    REMEDIATION_FAILED,
    VENUE_UNHEALTHY
};

const char* to_string(OrderSide side);
const char* to_string(PathFamily family);
const char* to_string(LegStatus status);
const char* to_string(ExecutionState state);
const char* to_string(TerminalState state);
const char* to_string(ErrorKind kind);

struct Pair {
    Asset base;
    Asset quote;

    std::string symbol() const { return base + "/" + quote; }
    bool involves(const Asset& asset) const { return base == asset || quote == asset; }

    bool operator==(const Pair& other) const { return base == other.base && quote == other.quote; }
    bool operator!=(const Pair& other) const { return !(*this == other); }
    bool operator<(const Pair& other) const {
        return base != other.base ? base < other.base : quote < other.quote;
    }

    // Parses "BASE/QUOTE"; throws ValidationError on anything else.
    static Pair parse(const std::string& symbol);
};

struct DepthLevel {
    Decimal price;
    Decimal quantity;
};

struct OrderBookSnapshot {
    Venue venue;
    Pair pair;
    Decimal best_bid;
    Decimal best_ask;
    std::vector<DepthLevel> bids; // best first
    std::vector<DepthLevel> asks; // best first
    TimePoint observed_at;

    Decimal mid() const;

    // Cumulative base quantity within pct percent of mid.
    Decimal bid_depth_at_pct(Decimal pct) const;
    Decimal ask_depth_at_pct(Decimal pct) const;

    // Cumulative base quantity of the first `levels` levels.
    Decimal top_bid_volume(size_t levels) const;
    Decimal top_ask_volume(size_t levels) const;

    bool is_crossed_or_empty() const {
        return !best_bid.is_positive() || !best_ask.is_positive() || best_bid > best_ask;
    }
};

struct Fee {
    Venue venue;
    Pair pair;
    Decimal maker_rate;
    Decimal taker_rate;
};

struct Leg {
    Venue venue;
    Pair pair;
    OrderSide action;

    const Asset& consumed() const { return action == OrderSide::BUY ? pair.quote : pair.base; }
    const Asset& received() const { return action == OrderSide::BUY ? pair.base : pair.quote; }
    std::string describe() const;
};

// Exclusive capital resource: one asset's balance on one venue.
struct ResourceKey {
    Venue venue;
    Asset asset;

    bool operator==(const ResourceKey& other) const { return venue == other.venue && asset == other.asset; }
    bool operator<(const ResourceKey& other) const {
        return venue != other.venue ? venue < other.venue : asset < other.asset;
    }
    std::string to_string() const { return venue + ":" + asset; }
};

struct Path {
    size_t id = 0;
    PathFamily family = PathFamily::CROSS_VENUE;
    Asset start_asset;
    std::vector<Leg> legs;

    std::vector<Asset> assets() const;
    std::vector<ResourceKey> resources() const;
    bool touches(const Asset& asset) const;
    std::string describe() const;
};

struct Opportunity {
    size_t path_id = 0;
    Decimal gross_profit_pct;
    Decimal net_profit_pct;
    Decimal max_safe_size;   // in start asset, filled in by the risk gate
    Decimal threshold_pct;   // threshold the gate compared against
    std::vector<TimePoint> snapshot_timestamps;
    std::vector<OrderBookSnapshot> snapshots; // one per leg, in leg order

    bool operator==(const Opportunity& other) const;
    bool operator!=(const Opportunity& other) const { return !(*this == other); }
};

struct OrderRequest {
    std::string client_order_id;
    Venue venue;
    Pair pair;
    OrderSide side;
    OrderType type = OrderType::MARKET;
    Decimal quantity;              // base units
    std::optional<Decimal> price;  // limit price, empty for market orders
};

// Pushed by the order gateway; `is_final` marks the last report for an order.
struct FillReport {
    std::string client_order_id;
    std::string order_id;
    Venue venue;
    OrderStatus status = OrderStatus::NEW;
    Decimal filled_quantity;   // base units
    Decimal average_price;
    Decimal received_amount;   // credited amount of the received asset, net of fees
    bool is_final = false;
    std::string message;
};

struct LegOutcome {
    Leg leg;
    std::string order_id;
    Decimal input_amount;      // consumed asset
    Decimal requested_quantity;
    Decimal filled_quantity;
    Decimal average_price;
    Decimal received_amount;   // received asset
    LegStatus status = LegStatus::NOT_PLACED;
    std::string message;
};

struct ExecutionResult {
    uint64_t execution_id = 0;
    size_t path_id = 0;
    Asset start_asset;
    Decimal expected_net_profit_pct;
    std::vector<LegOutcome> legs;
    std::vector<LegOutcome> remediations;
    Decimal start_size;
    Decimal final_amount;
    Decimal realized_profit;   // final_amount - start_size, in start asset
    TerminalState terminal_state = TerminalState::ROLLED_BACK;
    ErrorKind error = ErrorKind::NONE;
    std::string detail;
    TimePoint started_at;
    TimePoint finished_at;
};

// Balances the caller captured for one admission decision.
struct BalanceSnapshot {
    std::vector<std::pair<ResourceKey, Decimal>> entries;

    void set(const Venue& venue, const Asset& asset, Decimal amount);
    Decimal available(const Venue& venue, const Asset& asset) const;
};

struct MarketContext {
    Decimal volatility_pct;   // max over the path's assets
    Decimal imbalance;        // max |imbalance| over the path's books
    BalanceSnapshot balances;
};

struct Alert {
    enum class Level {
        INFO,
        WARNING,
        CRITICAL
    };
    Level level = Level::INFO;
    ErrorKind kind = ErrorKind::NONE;
    std::string title;
    std::string message;
    TimePoint timestamp;
};

} // namespace arbx
