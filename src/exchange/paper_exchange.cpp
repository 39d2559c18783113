#include "paper_exchange.hpp"
#include "../data/snapshot_cache.hpp"
#include "../utils/logger.hpp"

namespace arbx {

PaperExchange::PaperExchange(SnapshotCache& cache, const std::map<std::string, ExchangeConfig>& exchanges)
    : cache_(cache) {
    for (const auto& [name, config] : exchanges) {
        if (!config.enabled) {
            continue;
        }
        VenueAccount account;
        account.config = config;
        account.config.name = name;
        for (const auto& symbol : config.markets) {
            account.markets.push_back(Pair::parse(symbol));
        }
        accounts_.emplace(name, std::move(account));
    }
}

PaperExchange::VenueAccount& PaperExchange::account_for(const Venue& venue) {
    auto it = accounts_.find(venue);
    if (it == accounts_.end()) {
        throw ExchangeException(venue, "unknown venue");
    }
    return it->second;
}

Decimal PaperExchange::taker_rate(const VenueAccount& account) const {
    return account.config.taker_fee * (Decimal::one() - account.config.fee_discount_pct / Decimal::hundred());
}

std::string PaperExchange::place_order(const OrderRequest& request) {
    if (request.type != OrderType::MARKET) {
        throw ExchangeException(request.venue, "paper venues accept market orders only");
    }
    if (!request.quantity.is_positive()) {
        throw ExchangeException(request.venue, "quantity must be positive");
    }

    auto read = cache_.read(request.venue, request.pair);
    if (!read.snapshot || read.snapshot->is_crossed_or_empty()) {
        throw ExchangeException(request.venue, "no usable book for " + request.pair.symbol());
    }
    const OrderBookSnapshot& book = *read.snapshot;

    FillReport report;
    report.client_order_id = request.client_order_id;
    report.order_id = "paper-" + std::to_string(next_order_id_++);
    report.venue = request.venue;
    report.status = OrderStatus::FILLED;
    report.filled_quantity = request.quantity;
    report.is_final = true;

    FillListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        VenueAccount& account = account_for(request.venue);

        bool listed = false;
        for (const auto& market : account.markets) {
            listed = listed || market == request.pair;
        }
        if (!listed) {
            throw ExchangeException(request.venue, request.pair.symbol() + " is not listed");
        }

        const Decimal fee_factor = Decimal::one() - taker_rate(account);
        Asset spent_asset;
        Decimal spent;
        Asset received_asset;

        if (request.side == OrderSide::BUY) {
            report.average_price = book.best_ask;
            spent_asset = request.pair.quote;
            spent = request.quantity * book.best_ask;
            received_asset = request.pair.base;
            report.received_amount = request.quantity * fee_factor;
        } else {
            report.average_price = book.best_bid;
            spent_asset = request.pair.base;
            spent = request.quantity;
            received_asset = request.pair.quote;
            report.received_amount = request.quantity * book.best_bid * fee_factor;
        }

        Decimal& balance = account.balances[spent_asset];
        if (balance < spent) {
            throw ExchangeException(request.venue, "insufficient " + spent_asset + ": need " + spent.to_string() +
                                                       ", have " + balance.to_string());
        }
        balance = balance - spent;
        account.balances[received_asset] = account.balances[received_asset] + report.received_amount;
        listener = listener_;
    }

    ++orders_filled_;
    ARBX_LOG_DEBUG("Paper fill {} on {}: {} {} @ {}", report.order_id, request.venue, to_string(request.side),
                   request.quantity.to_string(), report.average_price.to_string());

    if (listener != nullptr) {
        listener->on_fill(report);
    }
    return report.order_id;
}

bool PaperExchange::cancel_order(const Venue& venue, const std::string& order_id) {
    // Everything fills on placement, nothing is left to cancel.
    ARBX_LOG_DEBUG("Cancel of {} on {} ignored", order_id, venue);
    return false;
}

void PaperExchange::set_fill_listener(FillListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
}

Decimal PaperExchange::available(const Venue& venue, const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(venue);
    if (it == accounts_.end()) {
        return Decimal::zero();
    }
    auto balance = it->second.balances.find(asset);
    return balance == it->second.balances.end() ? Decimal::zero() : balance->second;
}

std::vector<Fee> PaperExchange::fetch_fees(const Venue& venue) {
    std::lock_guard<std::mutex> lock(mutex_);
    const VenueAccount& account = account_for(venue);

    std::vector<Fee> fees;
    fees.reserve(account.markets.size());
    for (const auto& market : account.markets) {
        fees.push_back(Fee{venue, market, account.config.maker_fee, account.config.taker_fee});
    }
    return fees;
}

void PaperExchange::deposit(const Venue& venue, const Asset& asset, Decimal amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Decimal& balance = account_for(venue).balances[asset];
    balance = balance + amount;
}

std::map<Asset, Decimal> PaperExchange::balances(const Venue& venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(venue);
    return it == accounts_.end() ? std::map<Asset, Decimal>{} : it->second.balances;
}

} // namespace arbx
