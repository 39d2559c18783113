#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "data/fee_schedule.hpp"
#include "mocks/mock_fee_provider.hpp"
#include "test_support.hpp"

using namespace arbx;
using namespace arbx::testing;
using ::testing::Return;
using ::testing::Throw;

class FeeScheduleTest : public ::testing::Test {
protected:
    void SetUp() override {
        ExchangeConfig kraken;
        kraken.maker_fee = dec("0.0016");
        kraken.taker_fee = dec("0.0026");
        ExchangeConfig binanceus;
        binanceus.maker_fee = dec("0.001");
        binanceus.taker_fee = dec("0.001");
        binanceus.fee_discount_pct = dec("25");
        exchanges = {{"kraken", kraken}, {"binanceus", binanceus}};
    }

    std::map<std::string, ExchangeConfig> exchanges;
    ::testing::NiceMock<mocks::MockFeeProvider> provider;
};

TEST_F(FeeScheduleTest, UnknownVenueHasNoFee) {
    FeeSchedule schedule;
    EXPECT_FALSE(schedule.fee_for("kraken", Pair::parse("BTC/USDT")).has_value());
}

TEST_F(FeeScheduleTest, VenueDefaultsApplyToEveryPair) {
    FeeSchedule schedule;
    schedule.configure(exchanges);

    auto fee = schedule.fee_for("kraken", Pair::parse("SOL/USDT"));
    ASSERT_TRUE(fee.has_value());
    EXPECT_EQ(fee->maker_rate, dec("0.0016"));
    EXPECT_EQ(fee->taker_rate, dec("0.0026"));
    EXPECT_EQ(fee->pair, Pair::parse("SOL/USDT"));
}

TEST_F(FeeScheduleTest, DiscountReducesRates) {
    FeeSchedule schedule;
    schedule.configure(exchanges);

    auto fee = schedule.fee_for("binanceus", Pair::parse("BTC/USDT"));
    ASSERT_TRUE(fee.has_value());
    EXPECT_EQ(fee->taker_rate, dec("0.00075"));
}

TEST_F(FeeScheduleTest, PairRateOverridesVenueDefault) {
    FeeSchedule schedule;
    schedule.configure(exchanges);
    schedule.set_fee(Fee{"kraken", Pair::parse("BTC/USDT"), dec("0"), dec("0.002")});

    EXPECT_EQ(schedule.fee_for("kraken", Pair::parse("BTC/USDT"))->taker_rate, dec("0.002"));
    EXPECT_EQ(schedule.fee_for("kraken", Pair::parse("ETH/USDT"))->taker_rate, dec("0.0026"));
}

TEST_F(FeeScheduleTest, RefreshStoresFetchedRates) {
    FeeSchedule schedule(&provider);
    schedule.set_venue_default("kraken", dec("0.0016"), dec("0.0026"));

    EXPECT_CALL(provider, fetch_fees("kraken"))
        .WillOnce(Return(std::vector<Fee>{Fee{"kraken", Pair::parse("ETH/BTC"), dec("0.001"), dec("0.0015")}}));

    EXPECT_EQ(schedule.refresh(), 1u);
    EXPECT_EQ(schedule.fee_for("kraken", Pair::parse("ETH/BTC"))->taker_rate, dec("0.0015"));
    EXPECT_FALSE(schedule.refresh_due(schedule.last_refresh(), std::chrono::milliseconds(1000)));
    EXPECT_TRUE(schedule.refresh_due(schedule.last_refresh() + std::chrono::seconds(1), std::chrono::milliseconds(1000)));
}

TEST_F(FeeScheduleTest, FailedFetchKeepsPreviousRates) {
    FeeSchedule schedule(&provider);
    schedule.configure(exchanges);
    schedule.set_fee(Fee{"kraken", Pair::parse("BTC/USDT"), dec("0.001"), dec("0.002")});

    EXPECT_CALL(provider, fetch_fees("kraken")).WillOnce(Throw(ExchangeException("kraken", "timeout")));
    EXPECT_CALL(provider, fetch_fees("binanceus")).WillOnce(Return(std::vector<Fee>{}));

    EXPECT_EQ(schedule.refresh(), 0u);
    EXPECT_EQ(schedule.fee_for("kraken", Pair::parse("BTC/USDT"))->taker_rate, dec("0.002"));
}
