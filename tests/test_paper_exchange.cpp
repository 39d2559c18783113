#include <gtest/gtest.h>
#include <vector>
#include "data/snapshot_cache.hpp"
#include "exchange/paper_exchange.hpp"
#include "test_support.hpp"

using namespace arbx;
using namespace arbx::testing;

namespace {

class RecordingListener : public FillListener {
public:
    void on_fill(const FillReport& report) override { reports.push_back(report); }
    std::vector<FillReport> reports;
};

} // namespace

class PaperExchangeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ExchangeConfig kraken;
        kraken.markets = {"SOL/USDT", "ETH/BTC"};
        kraken.taker_fee = dec("0.001");
        cache = std::make_unique<SnapshotCache>(std::chrono::milliseconds(2000), clock.fn());
        exchange = std::make_unique<PaperExchange>(*cache, std::map<std::string, ExchangeConfig>{{"kraken", kraken}});
        exchange->set_fill_listener(&listener);

        cache->update(make_book("kraken", "SOL/USDT", dec("170.00"), dec("170.12"), dec("100"), clock.now()));
    }

    OrderRequest market_order(OrderSide side, Decimal quantity) {
        return OrderRequest{"arbx-1-L1", "kraken", Pair::parse("SOL/USDT"), side, OrderType::MARKET, quantity, std::nullopt};
    }

    ManualClock clock;
    std::unique_ptr<SnapshotCache> cache;
    std::unique_ptr<PaperExchange> exchange;
    RecordingListener listener;
};

TEST_F(PaperExchangeTest, BuyFillsAtAskAndChargesFeeOnBase) {
    exchange->deposit("kraken", "USDT", dec("1000"));

    std::string order_id = exchange->place_order(market_order(OrderSide::BUY, dec("2")));

    ASSERT_EQ(listener.reports.size(), 1u);
    const FillReport& report = listener.reports.front();
    EXPECT_EQ(report.order_id, order_id);
    EXPECT_EQ(report.client_order_id, "arbx-1-L1");
    EXPECT_TRUE(report.is_final);
    EXPECT_EQ(report.status, OrderStatus::FILLED);
    EXPECT_EQ(report.average_price, dec("170.12"));
    EXPECT_EQ(report.received_amount, dec("1.998"));

    EXPECT_EQ(exchange->available("kraken", "USDT"), dec("659.76"));
    EXPECT_EQ(exchange->available("kraken", "SOL"), dec("1.998"));
    EXPECT_EQ(exchange->orders_filled(), 1u);
}

TEST_F(PaperExchangeTest, SellFillsAtBid) {
    exchange->deposit("kraken", "SOL", dec("10"));

    exchange->place_order(market_order(OrderSide::SELL, dec("10")));

    ASSERT_EQ(listener.reports.size(), 1u);
    EXPECT_EQ(listener.reports.front().received_amount, dec("1698.3"));
    EXPECT_EQ(exchange->available("kraken", "SOL"), dec("0"));
    EXPECT_EQ(exchange->available("kraken", "USDT"), dec("1698.3"));
}

TEST_F(PaperExchangeTest, InsufficientBalanceThrows) {
    exchange->deposit("kraken", "USDT", dec("100"));

    EXPECT_THROW(exchange->place_order(market_order(OrderSide::BUY, dec("1"))), ExchangeException);
    EXPECT_TRUE(listener.reports.empty());
    EXPECT_EQ(exchange->available("kraken", "USDT"), dec("100"));
}

TEST_F(PaperExchangeTest, UnlistedOrBooklessMarketsThrow) {
    exchange->deposit("kraken", "BTC", dec("1"));

    OrderRequest no_book{"x", "kraken", Pair::parse("ETH/BTC"), OrderSide::BUY, OrderType::MARKET, dec("1"), std::nullopt};
    EXPECT_THROW(exchange->place_order(no_book), ExchangeException);

    OrderRequest unknown_venue = market_order(OrderSide::BUY, dec("1"));
    unknown_venue.venue = "nowhere";
    EXPECT_THROW(exchange->place_order(unknown_venue), ExchangeException);
}

TEST_F(PaperExchangeTest, FeesComeFromVenueConfig) {
    auto fees = exchange->fetch_fees("kraken");
    ASSERT_EQ(fees.size(), 2u);
    EXPECT_EQ(fees[0].pair, Pair::parse("SOL/USDT"));
    EXPECT_EQ(fees[0].taker_rate, dec("0.001"));
    EXPECT_THROW(exchange->fetch_fees("nowhere"), ExchangeException);
}
