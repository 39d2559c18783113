#pragma once

#include <string>
#include <vector>
#include "../core/types.hpp"
#include "exchange_exception.hpp"

namespace arbx {

class BalanceProvider {
public:
    virtual ~BalanceProvider() = default;

    // Synchronous; an unknown (venue, asset) is zero.
    virtual Decimal available(const Venue& venue, const Asset& asset) = 0;
};

class FeeProvider {
public:
    virtual ~FeeProvider() = default;

    // Throws ExchangeException when the venue cannot be queried.
    virtual std::vector<Fee> fetch_fees(const Venue& venue) = 0;
};

class FillListener {
public:
    virtual ~FillListener() = default;
    virtual void on_fill(const FillReport& report) = 0;
};

class OrderGateway {
public:
    virtual ~OrderGateway() = default;

    // Returns the venue order id. Fill reports for the order are pushed to
    // the registered FillListener, possibly before this call returns.
    virtual std::string place_order(const OrderRequest& request) = 0;

    // Best effort; returns false when the venue did not confirm.
    virtual bool cancel_order(const Venue& venue, const std::string& order_id) = 0;

    virtual void set_fill_listener(FillListener* listener) = 0;
};

} // namespace arbx
