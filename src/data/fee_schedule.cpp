#include "fee_schedule.hpp"
#include <mutex>
#include <vector>
#include "../utils/logger.hpp"

namespace arbx {

FeeSchedule::FeeSchedule(FeeProvider* provider) : provider_(provider) {}

void FeeSchedule::configure(const std::map<std::string, ExchangeConfig>& exchanges) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [name, config] : exchanges) {
        if (!config.enabled) {
            continue;
        }
        VenueFees& fees = venues_[name];
        fees.maker_rate = config.maker_fee;
        fees.taker_rate = config.taker_fee;
        fees.discount_pct = config.fee_discount_pct;
    }
}

void FeeSchedule::set_venue_default(const Venue& venue, Decimal maker_rate, Decimal taker_rate) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    VenueFees& fees = venues_[venue];
    fees.maker_rate = maker_rate;
    fees.taker_rate = taker_rate;
}

void FeeSchedule::set_fee(const Fee& fee) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pair_fees_[make_key(fee.venue, fee.pair)] = fee;
}

void FeeSchedule::set_discount_pct(const Venue& venue, Decimal discount_pct) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    venues_[venue].discount_pct = discount_pct;
}

std::optional<Fee> FeeSchedule::fee_for(const Venue& venue, const Pair& pair) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    Decimal discount;
    auto venue_it = venues_.find(venue);
    if (venue_it != venues_.end()) {
        discount = venue_it->second.discount_pct;
    }

    auto pair_it = pair_fees_.find(make_key(venue, pair));
    if (pair_it != pair_fees_.end()) {
        Fee fee = pair_it->second;
        fee.maker_rate = apply_discount(fee.maker_rate, discount);
        fee.taker_rate = apply_discount(fee.taker_rate, discount);
        return fee;
    }

    if (venue_it == venues_.end() || !venue_it->second.maker_rate || !venue_it->second.taker_rate) {
        return std::nullopt;
    }

    return Fee{venue, pair,
               apply_discount(*venue_it->second.maker_rate, discount),
               apply_discount(*venue_it->second.taker_rate, discount)};
}

size_t FeeSchedule::refresh() {
    if (provider_ == nullptr) {
        return 0;
    }
    ARBX_SCOPED_TIMER("fee refresh");

    std::vector<Venue> venues;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [venue, fees] : venues_) {
            venues.push_back(venue);
        }
    }

    // Fetch outside the lock; readers keep the old rates meanwhile.
    std::vector<Fee> fetched;
    for (const auto& venue : venues) {
        try {
            auto fees = provider_->fetch_fees(venue);
            fetched.insert(fetched.end(), fees.begin(), fees.end());
        } catch (const ExchangeException& e) {
            ARBX_LOG_WARN("Fee refresh failed for {}, keeping previous rates: {}", venue, e.what());
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& fee : fetched) {
        pair_fees_[make_key(fee.venue, fee.pair)] = fee;
    }
    last_refresh_ = Clock::now();
    ARBX_LOG_DEBUG("Fee schedule refreshed: {} rates from {} venues", fetched.size(), venues.size());
    return fetched.size();
}

bool FeeSchedule::refresh_due(TimePoint now, std::chrono::milliseconds interval) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return now - last_refresh_ >= interval;
}

TimePoint FeeSchedule::last_refresh() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_refresh_;
}

std::string FeeSchedule::make_key(const Venue& venue, const Pair& pair) {
    return venue + ":" + pair.symbol();
}

Decimal FeeSchedule::apply_discount(Decimal rate, Decimal discount_pct) {
    if (discount_pct.is_zero()) {
        return rate;
    }
    return rate * (Decimal::one() - discount_pct / Decimal::hundred());
}

} // namespace arbx
