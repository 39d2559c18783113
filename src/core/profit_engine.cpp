#include "profit_engine.hpp"
#include "../data/fee_schedule.hpp"
#include "../data/snapshot_cache.hpp"

namespace arbx {

Evaluation ProfitEngine::evaluate(const Path& path,
                                  const std::vector<OrderBookSnapshot>& snapshots,
                                  const std::vector<Fee>& fees,
                                  Decimal assumed_slippage_pct) {
    if (snapshots.size() != path.legs.size()) {
        return Evaluation::error({ErrorKind::MISSING_DATA, "expected one book per leg"});
    }
    if (fees.size() != path.legs.size()) {
        return Evaluation::error({ErrorKind::MISSING_FEE, "expected one fee per leg"});
    }

    const Decimal slippage = assumed_slippage_pct / Decimal::hundred();
    Decimal gross = Decimal::one();
    Decimal net = Decimal::one();

    for (size_t i = 0; i < path.legs.size(); ++i) {
        const Leg& leg = path.legs[i];
        const OrderBookSnapshot& book = snapshots[i];

        if (book.venue != leg.venue || book.pair != leg.pair) {
            return Evaluation::error({ErrorKind::MISSING_DATA, "book for " + book.venue + ":" + book.pair.symbol() +
                                                               " does not match leg " + leg.describe()});
        }
        if (book.is_crossed_or_empty()) {
            return Evaluation::error({ErrorKind::BAD_BOOK, "crossed or empty book for " + leg.describe()});
        }
        if (fees[i].venue != leg.venue || fees[i].pair != leg.pair) {
            return Evaluation::error({ErrorKind::MISSING_FEE, "no fee for " + leg.describe()});
        }

        gross = leg_output(leg, book, gross, Decimal::zero());
        net = leg_output(leg, book, net, fees[i].taker_rate + slippage);
    }

    Opportunity opportunity;
    opportunity.path_id = path.id;
    opportunity.gross_profit_pct = (gross - Decimal::one()) * Decimal::hundred();
    opportunity.net_profit_pct = (net - Decimal::one()) * Decimal::hundred();
    opportunity.snapshots = snapshots;
    for (const auto& book : snapshots) {
        opportunity.snapshot_timestamps.push_back(book.observed_at);
    }
    return opportunity;
}

Evaluation ProfitEngine::evaluate(const Path& path,
                                  const SnapshotCache& cache,
                                  const FeeSchedule& fee_schedule,
                                  Decimal assumed_slippage_pct) {
    std::vector<OrderBookSnapshot> snapshots;
    std::vector<Fee> fees;
    snapshots.reserve(path.legs.size());
    fees.reserve(path.legs.size());

    for (const auto& leg : path.legs) {
        SnapshotRead read = cache.read(leg.venue, leg.pair);
        if (!read.is_fresh()) {
            return Evaluation::error({read.error_kind(), "no fresh book for " + leg.describe()});
        }
        auto fee = fee_schedule.fee_for(leg.venue, leg.pair);
        if (!fee) {
            return Evaluation::error({ErrorKind::MISSING_FEE, "no fee for " + leg.describe()});
        }
        snapshots.push_back(std::move(*read.snapshot));
        fees.push_back(*fee);
    }

    return evaluate(path, snapshots, fees, assumed_slippage_pct);
}

Decimal ProfitEngine::leg_output(const Leg& leg, const OrderBookSnapshot& book, Decimal input, Decimal deduction) {
    Decimal converted = leg.action == OrderSide::BUY ? input / book.best_ask : input * book.best_bid;
    return converted * (Decimal::one() - deduction);
}

} // namespace arbx
