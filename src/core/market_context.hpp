#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <vector>
#include "types.hpp"

namespace arbx {

// Rolling mid-price volatility per asset and order-book imbalance. Mids are
// only recorded from stablecoin-quoted books so every asset is measured in
// the same unit.
class MarketContextTracker {
public:
    MarketContextTracker(std::vector<Asset> stablecoins, size_t window, Decimal volatility_band_pct,
                         size_t depth_levels);

    void configure(size_t window, Decimal volatility_band_pct, size_t depth_levels);

    // Snapshot-cache listener.
    void on_snapshot(const OrderBookSnapshot& snapshot);

    void record_mid(const Asset& asset, Decimal mid, TimePoint at);

    // Standard deviation of the window over its mean, in percent. Zero with
    // fewer than two samples.
    Decimal volatility_pct(const Asset& asset) const;

    // 2 while the asset trades above the volatility band, else 1.
    int slowdown_factor(const Asset& asset) const;
    int slowdown_factor(const Path& path) const;

    // (bid volume - ask volume) / (bid volume + ask volume) over the top
    // `levels` levels; zero for an empty book.
    static Decimal imbalance(const OrderBookSnapshot& snapshot, size_t levels);

    MarketContext context_for(const Path& path, const Opportunity& opportunity, BalanceSnapshot balances) const;

    size_t sample_count(const Asset& asset) const;

private:
    struct Sample {
        Decimal mid;
        TimePoint at;
    };

    Decimal volatility_locked(const Asset& asset) const;

    mutable std::mutex mutex_;
    std::set<Asset> stablecoins_;
    size_t window_;
    Decimal volatility_band_pct_;
    size_t depth_levels_;
    std::map<Asset, std::deque<Sample>> samples_;
};

} // namespace arbx
