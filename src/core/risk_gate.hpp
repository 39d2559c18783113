#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace arbx {

class PathCatalog;

struct Admission {
    bool accepted = false;
    Decimal size_cap;          // start asset units
    Decimal threshold_pct;
    ErrorKind reason = ErrorKind::NONE;
    std::string detail;

    static Admission accept(Decimal size_cap, Decimal threshold_pct) {
        return Admission{true, size_cap, threshold_pct, ErrorKind::NONE, ""};
    }

    static Admission reject(ErrorKind reason, std::string detail, Decimal threshold_pct = Decimal::zero()) {
        return Admission{false, Decimal::zero(), threshold_pct, reason, std::move(detail)};
    }
};

// Final say before capital is committed: trading halt, the market-adaptive
// profit threshold, capital on every venue the path draws from, and book
// depth around each leg's size.
class RiskGate {
public:
    RiskGate(const PathCatalog& catalog, RiskConfig config);

    void set_config(RiskConfig config);

    Admission admit(const Opportunity& opportunity, const MarketContext& context) const;
    Admission admit(const Opportunity& opportunity, const MarketContext& context, const RiskConfig& config) const;

    // base + volatility and imbalance terms, clamped into [min, max].
    static Decimal dynamic_threshold(const MarketContext& context, const RiskConfig& config);

    // Adds a realized result to the daily tally of its start asset; a loss
    // beyond that asset's max_daily_loss halts trading.
    void record_realized(const Asset& asset, Decimal pnl);
    Decimal daily_loss(const Asset& asset) const;
    void reset_daily();

    void halt_trading(const std::string& reason);
    void resume_trading();
    bool is_halted() const { return halted_; }
    std::string halt_reason() const;

private:
    // Per unit of start asset: the consumed amount entering each leg and
    // the base quantity each leg trades, at the opportunity's books.
    struct LegRatios {
        Decimal input;
        Decimal base_quantity;
    };

    std::vector<LegRatios> leg_ratios(const Path& path, const Opportunity& opportunity) const;

    const PathCatalog& catalog_;

    mutable std::mutex mutex_;
    RiskConfig config_;
    std::map<Asset, Decimal> daily_loss_;
    std::atomic<bool> halted_{false};
    std::string halt_reason_;
};

} // namespace arbx
