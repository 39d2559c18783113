#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "exchange_interface.hpp"
#include "../utils/config_types.hpp"

namespace arbx {

class SnapshotCache;

// In-process venue set. Market orders fill immediately and completely at the
// best price of the cached book; the taker fee is taken from the received
// asset. Used by the demo binary so the engine runs without credentials.
class PaperExchange : public OrderGateway, public BalanceProvider, public FeeProvider {
public:
    PaperExchange(SnapshotCache& cache, const std::map<std::string, ExchangeConfig>& exchanges);

    std::string place_order(const OrderRequest& request) override;
    bool cancel_order(const Venue& venue, const std::string& order_id) override;
    void set_fill_listener(FillListener* listener) override;

    Decimal available(const Venue& venue, const Asset& asset) override;

    std::vector<Fee> fetch_fees(const Venue& venue) override;

    void deposit(const Venue& venue, const Asset& asset, Decimal amount);
    std::map<Asset, Decimal> balances(const Venue& venue) const;

    uint64_t orders_filled() const { return orders_filled_; }

private:
    struct VenueAccount {
        ExchangeConfig config;
        std::vector<Pair> markets;
        std::map<Asset, Decimal> balances;
    };

    VenueAccount& account_for(const Venue& venue);
    Decimal taker_rate(const VenueAccount& account) const;

    SnapshotCache& cache_;

    mutable std::mutex mutex_;
    std::map<Venue, VenueAccount> accounts_;
    FillListener* listener_ = nullptr;

    std::atomic<uint64_t> next_order_id_{1};
    std::atomic<uint64_t> orders_filled_{0};
};

} // namespace arbx
