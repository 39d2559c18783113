#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include "core/exceptions.hpp"
#include "core/path_catalog.hpp"
#include "test_support.hpp"

using namespace arbx;
using namespace arbx::testing;

class PathCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        universe = {"BTC", "ETH", "SOL", "USDT", "USDC", "USD"};
        venues = {
            VenueMarkets{"kraken", {Pair::parse("BTC/USDT"), Pair::parse("ETH/USDT"), Pair::parse("ETH/BTC"),
                                    Pair::parse("SOL/USDT")}},
            VenueMarkets{"binanceus", {Pair::parse("BTC/USDT"), Pair::parse("SOL/USDT"), Pair::parse("SOL/BTC")}},
            VenueMarkets{"coinbase", {Pair::parse("BTC/USD")}},
        };
    }

    std::vector<Asset> universe;
    std::vector<VenueMarkets> venues;
};

TEST_F(PathCatalogTest, CrossVenuePathsTradeOnePairOnTwoVenues) {
    PathCatalog catalog(universe, venues);

    auto ids = catalog.paths_for_family(PathFamily::CROSS_VENUE);
    // BTC/USDT and SOL/USDT on kraken and binanceus, both directions
    ASSERT_EQ(ids.size(), 4u);

    for (size_t id : ids) {
        const Path& path = catalog.path(id);
        ASSERT_EQ(path.legs.size(), 2u);
        EXPECT_EQ(path.legs[0].pair, path.legs[1].pair);
        EXPECT_NE(path.legs[0].venue, path.legs[1].venue);
        EXPECT_EQ(path.legs[0].action, OrderSide::BUY);
        EXPECT_EQ(path.legs[1].action, OrderSide::SELL);
        EXPECT_EQ(path.start_asset, path.legs[0].pair.quote);
    }

    const Path& first = catalog.path(ids.front());
    EXPECT_EQ(first.legs[0].pair, Pair::parse("BTC/USDT"));
    EXPECT_EQ(first.legs[0].venue, "kraken");
    EXPECT_EQ(first.legs[1].venue, "binanceus");
}

TEST_F(PathCatalogTest, EveryPathSatisfiesChainContinuity) {
    PathCatalog catalog(universe, venues);
    ASSERT_GT(catalog.size(), 0u);

    for (const auto& path : catalog.all_paths()) {
        EXPECT_EQ(path.legs.front().consumed(), path.start_asset) << path.describe();
        for (size_t i = 0; i + 1 < path.legs.size(); ++i) {
            EXPECT_EQ(path.legs[i].received(), path.legs[i + 1].consumed()) << path.describe();
        }
        EXPECT_EQ(path.legs.back().received(), path.start_asset) << path.describe();
        EXPECT_NO_THROW(PathCatalog::validate(path));
    }
}

TEST_F(PathCatalogTest, TriangularPathsStayOnOneVenueOverThreeAssets) {
    PathCatalog catalog(universe, venues);

    auto ids = catalog.paths_for_family(PathFamily::TRIANGULAR);
    // One triangle per venue, every start asset, both directions
    ASSERT_EQ(ids.size(), 12u);

    for (size_t id : ids) {
        const Path& path = catalog.path(id);
        ASSERT_EQ(path.legs.size(), 3u);
        std::set<Pair> pairs;
        for (const auto& leg : path.legs) {
            EXPECT_EQ(leg.venue, path.legs.front().venue);
            pairs.insert(leg.pair);
        }
        EXPECT_EQ(pairs.size(), 3u);
        EXPECT_EQ(path.assets().size(), 3u);
    }
}

TEST_F(PathCatalogTest, TriangleUsesSellWhenListedElseBuy) {
    PathCatalog catalog(universe, venues);

    auto ids = catalog.paths_for_family(PathFamily::TRIANGULAR);
    auto it = std::find_if(ids.begin(), ids.end(), [&](size_t id) {
        const Path& path = catalog.path(id);
        return path.legs[0].venue == "kraken" && path.start_asset == "USDT" && path.legs[0].received() == "BTC";
    });
    ASSERT_NE(it, ids.end());

    const Path& path = catalog.path(*it);
    EXPECT_EQ(path.legs[0].describe(), "BUY BTC/USDT@kraken");
    EXPECT_EQ(path.legs[1].describe(), "BUY ETH/BTC@kraken");
    EXPECT_EQ(path.legs[2].describe(), "SELL ETH/USDT@kraken");
}

TEST_F(PathCatalogTest, MarketOutsideUniverseIsConfigurationError) {
    venues.push_back(VenueMarkets{"kraken", {Pair::parse("DOGE/USDT")}});
    EXPECT_THROW({ PathCatalog catalog(universe, venues); }, ConfigurationError);
}

TEST_F(PathCatalogTest, ValidateRejectsBrokenChains) {
    Path broken;
    broken.id = 99;
    broken.family = PathFamily::CROSS_VENUE;
    broken.start_asset = "USDT";
    broken.legs = {Leg{"kraken", Pair::parse("BTC/USDT"), OrderSide::BUY},
                   Leg{"binanceus", Pair::parse("ETH/USDT"), OrderSide::SELL}};
    EXPECT_THROW(PathCatalog::validate(broken), InvalidPathError);

    Path wrong_start = broken;
    wrong_start.legs[1].pair = Pair::parse("BTC/USDT");
    wrong_start.start_asset = "BTC";
    EXPECT_THROW(PathCatalog::validate(wrong_start), InvalidPathError);

    Path same_venue = broken;
    same_venue.legs[1] = Leg{"kraken", Pair::parse("BTC/USDT"), OrderSide::SELL};
    EXPECT_THROW(PathCatalog::validate(same_venue), InvalidPathError);
}

TEST_F(PathCatalogTest, QueriesByAssetMarketAndId) {
    PathCatalog catalog(universe, venues);

    for (size_t id : catalog.paths_touching("SOL")) {
        EXPECT_TRUE(catalog.path(id).touches("SOL"));
    }
    EXPECT_TRUE(catalog.paths_touching("USD").empty());

    auto using_eth_btc = catalog.paths_using("kraken", Pair::parse("ETH/BTC"));
    EXPECT_EQ(using_eth_btc.size(), 6u);
    EXPECT_TRUE(catalog.paths_using("coinbase", Pair::parse("BTC/USD")).empty());

    EXPECT_THROW(catalog.path(catalog.size()), std::out_of_range);
}

TEST_F(PathCatalogTest, FindMarketPicksDirectionFromListing) {
    PathCatalog catalog(universe, venues);

    auto sell = catalog.find_market("kraken", "BTC", "USDT");
    ASSERT_TRUE(sell.has_value());
    EXPECT_EQ(sell->action, OrderSide::SELL);

    auto buy = catalog.find_market("kraken", "USDT", "BTC");
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy->action, OrderSide::BUY);
    EXPECT_EQ(buy->pair, Pair::parse("BTC/USDT"));

    EXPECT_FALSE(catalog.find_market("binanceus", "ETH", "USDT").has_value());
}

TEST_F(PathCatalogTest, FromConfigSkipsDisabledVenues) {
    EngineConfig config;
    ExchangeConfig kraken;
    kraken.markets = {"BTC/USDT", "ETH/USDT"};
    ExchangeConfig binanceus = kraken;
    ExchangeConfig disabled = kraken;
    disabled.enabled = false;
    config.exchanges = {{"kraken", kraken}, {"binanceus", binanceus}, {"offline", disabled}};

    auto catalog = PathCatalog::from_config(config);
    EXPECT_EQ(catalog.paths_for_family(PathFamily::CROSS_VENUE).size(), 4u);
    EXPECT_EQ(catalog.venues().size(), 2u);
}
