#include "market_context.hpp"

#include <algorithm>
#include <cmath>

namespace arbx {

MarketContextTracker::MarketContextTracker(std::vector<Asset> stablecoins, size_t window,
                                           Decimal volatility_band_pct, size_t depth_levels)
    : stablecoins_(stablecoins.begin(), stablecoins.end()),
      window_(std::max<size_t>(window, 2)),
      volatility_band_pct_(volatility_band_pct),
      depth_levels_(depth_levels) {}

void MarketContextTracker::configure(size_t window, Decimal volatility_band_pct, size_t depth_levels) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_ = std::max<size_t>(window, 2);
    volatility_band_pct_ = volatility_band_pct;
    depth_levels_ = depth_levels;
    for (auto& [asset, samples] : samples_) {
        while (samples.size() > window_) {
            samples.pop_front();
        }
    }
}

void MarketContextTracker::on_snapshot(const OrderBookSnapshot& snapshot) {
    if (stablecoins_.count(snapshot.pair.quote) == 0 || snapshot.is_crossed_or_empty()) {
        return;
    }
    record_mid(snapshot.pair.base, snapshot.mid(), snapshot.observed_at);
}

void MarketContextTracker::record_mid(const Asset& asset, Decimal mid, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& samples = samples_[asset];
    samples.push_back(Sample{mid, at});
    while (samples.size() > window_) {
        samples.pop_front();
    }
}

Decimal MarketContextTracker::volatility_pct(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return volatility_locked(asset);
}

int MarketContextTracker::slowdown_factor(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return volatility_locked(asset) > volatility_band_pct_ ? 2 : 1;
}

int MarketContextTracker::slowdown_factor(const Path& path) const {
    int factor = 1;
    for (const auto& asset : path.assets()) {
        factor = std::max(factor, slowdown_factor(asset));
    }
    return factor;
}

Decimal MarketContextTracker::imbalance(const OrderBookSnapshot& snapshot, size_t levels) {
    Decimal bid_volume = snapshot.top_bid_volume(levels);
    Decimal ask_volume = snapshot.top_ask_volume(levels);
    Decimal total = bid_volume + ask_volume;
    if (total.is_zero()) {
        return Decimal::zero();
    }
    return (bid_volume - ask_volume) / total;
}

MarketContext MarketContextTracker::context_for(const Path& path, const Opportunity& opportunity,
                                                BalanceSnapshot balances) const {
    MarketContext context;
    size_t levels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        levels = depth_levels_;
        for (const auto& asset : path.assets()) {
            context.volatility_pct = max(context.volatility_pct, volatility_locked(asset));
        }
    }
    for (const auto& snapshot : opportunity.snapshots) {
        context.imbalance = max(context.imbalance, imbalance(snapshot, levels).abs());
    }
    context.balances = std::move(balances);
    return context;
}

size_t MarketContextTracker::sample_count(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = samples_.find(asset);
    return it == samples_.end() ? 0 : it->second.size();
}

Decimal MarketContextTracker::volatility_locked(const Asset& asset) const {
    auto it = samples_.find(asset);
    if (it == samples_.end() || it->second.size() < 2) {
        return Decimal::zero();
    }

    // Statistics only; the result is truncated to 6 decimals.
    const auto& samples = it->second;
    double sum = 0.0;
    for (const auto& sample : samples) {
        sum += sample.mid.to_double();
    }
    double mean = sum / static_cast<double>(samples.size());
    if (mean <= 0.0) {
        return Decimal::zero();
    }

    double variance = 0.0;
    for (const auto& sample : samples) {
        double diff = sample.mid.to_double() - mean;
        variance += diff * diff;
    }
    variance /= static_cast<double>(samples.size());

    return Decimal::from_double(std::sqrt(variance) / mean * 100.0).truncate(6);
}

} // namespace arbx
