#pragma once

#include <string>
#include <vector>
#include "result.hpp"
#include "types.hpp"

namespace arbx {

class SnapshotCache;
class FeeSchedule;

struct EvaluationFailure {
    ErrorKind kind = ErrorKind::NONE;
    std::string detail;
};

using Evaluation = Result<Opportunity, EvaluationFailure>;

// Net profit of one pass around a path, starting from one unit of the start
// asset. Buy legs divide by the ask, sell legs multiply by the bid, and every
// leg keeps (1 - taker fee - slippage) of its output.
class ProfitEngine {
public:
    // Pure: the result depends only on the arguments. `snapshots` and
    // `fees` are in leg order.
    static Evaluation evaluate(const Path& path,
                               const std::vector<OrderBookSnapshot>& snapshots,
                               const std::vector<Fee>& fees,
                               Decimal assumed_slippage_pct);

    // Reads each leg's book and fee; stale or missing inputs make the path
    // unevaluable for this cycle.
    static Evaluation evaluate(const Path& path,
                               const SnapshotCache& cache,
                               const FeeSchedule& fees,
                               Decimal assumed_slippage_pct);

    // Amount of the leg's received asset for `input` of its consumed asset.
    static Decimal leg_output(const Leg& leg, const OrderBookSnapshot& book, Decimal input, Decimal deduction);
};

} // namespace arbx
