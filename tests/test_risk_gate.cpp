#include <gtest/gtest.h>
#include "core/path_catalog.hpp"
#include "core/profit_engine.hpp"
#include "core/risk_gate.hpp"
#include "test_support.hpp"

using namespace arbx;
using namespace arbx::testing;

class RiskGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog = std::make_unique<PathCatalog>(
            std::vector<Asset>{"BTC", "SOL", "USDT"},
            std::vector<VenueMarkets>{
                VenueMarkets{"kraken", {Pair::parse("BTC/USDT"), Pair::parse("SOL/USDT")}},
                VenueMarkets{"binanceus", {Pair::parse("BTC/USDT"), Pair::parse("SOL/USDT")}}});

        config.min_trade_size = {{"USDT", dec("10")}};
        config.max_trade_size = {{"USDT", dec("1000")}};
        config.max_daily_loss = {{"USDT", dec("50")}};
        gate = std::make_unique<RiskGate>(*catalog, config);

        context.balances.set("kraken", "USDT", dec("10000"));
        context.balances.set("binanceus", "SOL", dec("100"));
        context.balances.set("binanceus", "BTC", dec("1"));
    }

    // Buy on kraken, sell on binanceus.
    size_t path_for(const std::string& symbol) const {
        for (size_t id : catalog->paths_using("kraken", Pair::parse(symbol))) {
            const Path& path = catalog->path(id);
            if (path.legs[0].venue == "kraken") {
                return id;
            }
        }
        return catalog->size();
    }

    Opportunity evaluate(const std::string& symbol, const char* ask, const char* bid, Decimal level_quantity) {
        const Path& path = catalog->path(path_for(symbol));
        std::vector<OrderBookSnapshot> books = {
            make_book("kraken", symbol, dec(ask) - dec("0.1"), dec(ask), level_quantity, clock.now()),
            make_book("binanceus", symbol, dec(bid), dec(bid) + dec("0.1"), level_quantity, clock.now()),
        };
        std::vector<Fee> fees;
        for (const auto& leg : path.legs) {
            fees.push_back(Fee{leg.venue, leg.pair, dec("0.001"), dec("0.001")});
        }
        auto result = ProfitEngine::evaluate(path, books, fees, Decimal::zero());
        EXPECT_TRUE(result.is_success());
        return result.value();
    }

    ManualClock clock;
    std::unique_ptr<PathCatalog> catalog;
    RiskConfig config;
    std::unique_ptr<RiskGate> gate;
    MarketContext context;
};

TEST_F(RiskGateTest, NarrowSpreadIsBelowThreshold) {
    Opportunity opportunity = evaluate("BTC/USDT", "65001.20", "65004.50", dec("10"));

    Admission admission = gate->admit(opportunity, context);
    EXPECT_FALSE(admission.accepted);
    EXPECT_EQ(admission.reason, ErrorKind::BELOW_THRESHOLD);
    EXPECT_EQ(admission.threshold_pct, dec("0.5"));
}

TEST_F(RiskGateTest, WideSpreadWithDeepBooksIsAcceptedAtMaxSize) {
    Opportunity opportunity = evaluate("SOL/USDT", "170.12", "171.50", dec("100"));

    Admission admission = gate->admit(opportunity, context);
    ASSERT_TRUE(admission.accepted) << admission.detail;
    EXPECT_EQ(admission.size_cap, dec("1000"));
    EXPECT_EQ(admission.threshold_pct, dec("0.5"));
}

TEST_F(RiskGateTest, ShallowBookShrinksSizeToDepthMultiple) {
    // Top-5 ask depth of 12 SOL is about 2x the 5.88 SOL that 1000 USDT buys.
    Opportunity opportunity = evaluate("SOL/USDT", "170.12", "171.50", dec("2.4"));

    Admission admission = gate->admit(opportunity, context);
    ASSERT_TRUE(admission.accepted) << admission.detail;
    EXPECT_LT(admission.size_cap, dec("1000"));
    // 12 SOL / 2.5 * 170.12
    EXPECT_NEAR(admission.size_cap.to_double(), 816.576, 0.01);

    Decimal bought = admission.size_cap / dec("170.12");
    EXPECT_LE(config.depth_multiple * bought, dec("12.000001"));
}

TEST_F(RiskGateTest, ShallowBookBelowMinimumSizeIsRejected) {
    config.min_trade_size["USDT"] = dec("900");
    gate->set_config(config);
    Opportunity opportunity = evaluate("SOL/USDT", "170.12", "171.50", dec("2.4"));

    Admission admission = gate->admit(opportunity, context);
    EXPECT_FALSE(admission.accepted);
    EXPECT_EQ(admission.reason, ErrorKind::INSUFFICIENT_DEPTH);
}

TEST_F(RiskGateTest, MissingOriginBalanceIsInsufficient) {
    Opportunity opportunity = evaluate("SOL/USDT", "170.12", "171.50", dec("100"));
    MarketContext empty;

    Admission admission = gate->admit(opportunity, empty);
    EXPECT_FALSE(admission.accepted);
    EXPECT_EQ(admission.reason, ErrorKind::INSUFFICIENT_BALANCE);
}

TEST_F(RiskGateTest, SellVenueInventoryBoundsSize) {
    context.balances.set("binanceus", "SOL", dec("1"));
    Opportunity opportunity = evaluate("SOL/USDT", "170.12", "171.50", dec("100"));

    Admission admission = gate->admit(opportunity, context);
    ASSERT_TRUE(admission.accepted) << admission.detail;
    EXPECT_NEAR(admission.size_cap.to_double(), 170.12, 0.0001);
}

TEST_F(RiskGateTest, LargeVenueBalancesAreSized) {
    // 150 BTC on the sell venue bounds the size at roughly 9.75M USDT.
    context.balances.set("kraken", "USDT", dec("10000000"));
    context.balances.set("binanceus", "BTC", dec("150"));
    Opportunity opportunity = evaluate("BTC/USDT", "65001.20", "65900.00", dec("5"));

    Admission capped;
    ASSERT_NO_THROW(capped = gate->admit(opportunity, context));
    ASSERT_TRUE(capped.accepted) << capped.detail;
    EXPECT_EQ(capped.size_cap, dec("1000"));

    RiskConfig uncapped = config;
    uncapped.max_trade_size.clear();
    Admission admission;
    ASSERT_NO_THROW(admission = gate->admit(opportunity, context, uncapped));
    ASSERT_TRUE(admission.accepted) << admission.detail;
    // Top-5 ask depth of 25 BTC over 2.5x leaves about 10 BTC worth of USDT.
    EXPECT_GT(admission.size_cap, dec("650000"));
    EXPECT_LT(admission.size_cap, dec("650020"));
}

TEST_F(RiskGateTest, ThresholdRisesWithVolatilityAndImbalance) {
    context.volatility_pct = dec("2");
    context.imbalance = dec("0.5");
    // 0.5 + 0.1 * 2 + 0.2 * 0.5
    EXPECT_EQ(RiskGate::dynamic_threshold(context, config), dec("0.8"));

    Opportunity opportunity = evaluate("SOL/USDT", "170.12", "171.50", dec("100"));
    Admission admission = gate->admit(opportunity, context);
    EXPECT_FALSE(admission.accepted);
    EXPECT_EQ(admission.reason, ErrorKind::BELOW_THRESHOLD);
}

TEST_F(RiskGateTest, ThresholdStaysInsideBand) {
    for (const char* volatility : {"0", "0.5", "3", "10", "50"}) {
        for (const char* imbalance : {"0", "-1", "0.3", "1"}) {
            context.volatility_pct = dec(volatility);
            context.imbalance = dec(imbalance);
            Decimal threshold = RiskGate::dynamic_threshold(context, config);
            EXPECT_GE(threshold, config.min_threshold_pct);
            EXPECT_LE(threshold, config.max_threshold_pct);
        }
    }

    config.base_threshold_pct = dec("0.1");
    context.volatility_pct = Decimal::zero();
    context.imbalance = Decimal::zero();
    EXPECT_EQ(RiskGate::dynamic_threshold(context, config), dec("0.4"));
}

TEST_F(RiskGateTest, HaltRejectsEverything) {
    Opportunity opportunity = evaluate("SOL/USDT", "170.12", "171.50", dec("100"));
    gate->halt_trading("manual");

    Admission admission = gate->admit(opportunity, context);
    EXPECT_FALSE(admission.accepted);
    EXPECT_EQ(admission.reason, ErrorKind::TRADING_HALTED);
    EXPECT_EQ(gate->halt_reason(), "manual");

    gate->resume_trading();
    EXPECT_TRUE(gate->admit(opportunity, context).accepted);
}

TEST_F(RiskGateTest, DailyLossLimitHaltsTrading) {
    gate->record_realized("USDT", dec("20"));
    gate->record_realized("USDT", dec("-30"));
    EXPECT_FALSE(gate->is_halted());
    EXPECT_EQ(gate->daily_loss("USDT"), dec("30"));

    gate->record_realized("USDT", dec("-30"));
    EXPECT_TRUE(gate->is_halted());

    gate->reset_daily();
    EXPECT_EQ(gate->daily_loss("USDT"), Decimal::zero());
    EXPECT_TRUE(gate->is_halted());
}
