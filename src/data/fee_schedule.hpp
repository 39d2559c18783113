#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include "../core/types.hpp"
#include "../exchange/exchange_interface.hpp"
#include "../utils/config_types.hpp"

namespace arbx {

// Maker/taker rates per (venue, pair). Pair-specific rates fetched from the
// FeeProvider take precedence over the configured venue defaults; the venue's
// fee discount applies to both.
class FeeSchedule {
public:
    explicit FeeSchedule(FeeProvider* provider = nullptr);

    void configure(const std::map<std::string, ExchangeConfig>& exchanges);

    void set_venue_default(const Venue& venue, Decimal maker_rate, Decimal taker_rate);
    void set_fee(const Fee& fee);
    void set_discount_pct(const Venue& venue, Decimal discount_pct);

    // Empty when neither a pair rate nor a venue default is known.
    std::optional<Fee> fee_for(const Venue& venue, const Pair& pair) const;

    // Pulls fresh rates for every configured venue. A venue whose fetch
    // fails keeps its previous rates. Returns the number of rates stored.
    size_t refresh();

    bool refresh_due(TimePoint now, std::chrono::milliseconds interval) const;
    TimePoint last_refresh() const;

private:
    struct VenueFees {
        std::optional<Decimal> maker_rate;
        std::optional<Decimal> taker_rate;
        Decimal discount_pct;
    };

    static std::string make_key(const Venue& venue, const Pair& pair);
    static Decimal apply_discount(Decimal rate, Decimal discount_pct);

    FeeProvider* provider_;
    mutable std::shared_mutex mutex_;
    std::map<Venue, VenueFees> venues_;
    std::map<std::string, Fee> pair_fees_;
    TimePoint last_refresh_{};
};

} // namespace arbx
