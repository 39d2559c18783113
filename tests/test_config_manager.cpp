#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "utils/config_manager.hpp"
#include "test_support.hpp"

using namespace arbx;
using namespace arbx::testing;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_arbx_config.json";
        config_manager = std::make_unique<ConfigManager>();
    }

    void TearDown() override {
        std::filesystem::remove(test_config_file);
    }

    static nlohmann::json exchange_section(const std::string& taker_fee) {
        return {
            {"enabled", true},
            {"markets", {"BTC/USDT", "ETH/USDT", "ETH/BTC"}},
            {"maker_fee", "0.001"},
            {"taker_fee", taker_fee},
            {"fee_discount_pct", "25"},
            {"fill_timeout_ms", 5000}
        };
    }

    static nlohmann::json minimal_config() {
        return {
            {"config_version", 1},
            {"exchanges", {{"kraken", exchange_section("0.0026")}}}
        };
    }

    void write_config(const nlohmann::json& config) {
        std::ofstream file(test_config_file);
        file << config.dump(4);
    }

    std::string test_config_file;
    std::unique_ptr<ConfigManager> config_manager;
};

TEST_F(ConfigManagerTest, DefaultConfiguration) {
    auto config = config_manager->snapshot();
    ASSERT_NE(config, nullptr);
    EXPECT_TRUE(config->app.paper_trading);
    EXPECT_EQ(config->risk.base_threshold_pct, dec("0.5"));
    EXPECT_EQ(config->risk.min_threshold_pct, dec("0.4"));
    EXPECT_EQ(config->risk.max_threshold_pct, dec("1.0"));
    EXPECT_EQ(config->risk.depth_multiple, dec("2.5"));
    EXPECT_EQ(config->scheduler.min_scan_spacing_ms, 250);
    EXPECT_EQ(config->scheduler.freshness_window_ms, 2000);
    EXPECT_EQ(config->health.window, 20);
    EXPECT_EQ(config->health.unhealthy_error_rate_pct, dec("30"));
}

TEST_F(ConfigManagerTest, OptionalSectionsKeepDefaults) {
    ASSERT_TRUE(config_manager->load_from_json(minimal_config())) << config_manager->last_error();

    auto config = config_manager->snapshot();
    ASSERT_EQ(config->exchanges.size(), 1u);
    const auto& kraken = config->exchanges.at("kraken");
    EXPECT_EQ(kraken.name, "kraken");
    EXPECT_EQ(kraken.taker_fee, dec("0.0026"));
    EXPECT_EQ(kraken.fee_discount_pct, dec("25"));
    EXPECT_EQ(kraken.markets.size(), 3u);
    EXPECT_EQ(config->scheduler.worker_threads, 4);
    EXPECT_EQ(config->universe.stablecoins.size(), 3u);
}

TEST_F(ConfigManagerTest, ConfigurationSaveLoad) {
    EngineConfig original;
    original.exchanges["binanceus"].markets = {"SOL/USDT"};
    original.risk.max_trade_size = {{"USDT", dec("2500")}};
    original.risk.max_daily_loss = {{"USDT", dec("100")}};
    original.scheduler.cross_venue_interval_ms = 5000;
    write_config(nlohmann::json(original));

    ASSERT_TRUE(config_manager->load(test_config_file)) << config_manager->last_error();

    auto config = config_manager->snapshot();
    EXPECT_EQ(config->exchanges.at("binanceus").name, "binanceus");
    EXPECT_EQ(config->risk.max_trade_size.at("USDT"), dec("2500"));
    EXPECT_EQ(config->risk.max_daily_loss.at("USDT"), dec("100"));
    EXPECT_EQ(config->scheduler.cross_venue_interval_ms, 5000);
}

TEST_F(ConfigManagerTest, DecimalsAcceptNumbers) {
    auto json = minimal_config();
    json["exchanges"]["kraken"]["taker_fee"] = 0.002;
    json["exchanges"]["kraken"]["fee_discount_pct"] = 10;

    ASSERT_TRUE(config_manager->load_from_json(json));
    EXPECT_EQ(config_manager->snapshot()->exchanges.at("kraken").taker_fee, dec("0.002"));
    EXPECT_EQ(config_manager->snapshot()->exchanges.at("kraken").fee_discount_pct, dec("10"));
}

TEST_F(ConfigManagerTest, ConfigurationValidation) {
    auto json = minimal_config();
    json["exchanges"]["kraken"] = exchange_section("0.5");
    json["exchanges"]["kraken"]["markets"] = {"BTCUSDT"};

    EXPECT_FALSE(config_manager->load_from_json(json));

    const auto& issues = config_manager->last_issues();
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].field, "exchanges.kraken.markets");
    EXPECT_EQ(issues[1].field, "exchanges.kraken.taker_fee");
    EXPECT_NE(config_manager->last_error().find("2 configuration issue(s)"), std::string::npos);
}

TEST_F(ConfigManagerTest, ThresholdBoundsMustBeOrdered) {
    EngineConfig config;
    config.exchanges["kraken"].markets = {"BTC/USDT"};
    config.risk.min_threshold_pct = dec("1.5");
    config.risk.max_threshold_pct = dec("1.0");

    EXPECT_FALSE(config_manager->load_from_json(nlohmann::json(config)));
    ASSERT_FALSE(config_manager->last_issues().empty());
    EXPECT_EQ(config_manager->last_issues().front().field, "risk.min_threshold_pct");
}

TEST_F(ConfigManagerTest, HealthBandsMustBeOrdered) {
    EngineConfig config;
    config.exchanges["kraken"].markets = {"BTC/USDT"};
    config.health.degraded_error_rate_pct = dec("20");
    config.health.unhealthy_error_rate_pct = dec("15");

    EXPECT_FALSE(config_manager->load_from_json(nlohmann::json(config)));
    ASSERT_FALSE(config_manager->last_issues().empty());
    EXPECT_EQ(config_manager->last_issues().front().field, "health.unhealthy_error_rate_pct");
}

TEST_F(ConfigManagerTest, DuplicateUniverseAssetRejected) {
    EngineConfig config;
    config.exchanges["kraken"].markets = {"BTC/USDT"};
    config.universe.assets = {"BTC", "USDT"};
    config.universe.stablecoins = {"USDT"};

    EXPECT_FALSE(config_manager->load_from_json(nlohmann::json(config)));
    EXPECT_EQ(config_manager->last_issues().front().field, "universe");
}

TEST_F(ConfigManagerTest, RequiresEnabledExchange) {
    auto json = minimal_config();
    json["exchanges"]["kraken"]["enabled"] = false;

    EXPECT_FALSE(config_manager->load_from_json(json));
    EXPECT_EQ(config_manager->last_issues().back().field, "exchanges");
}

TEST_F(ConfigManagerTest, MalformedDecimalRejected) {
    auto json = minimal_config();
    json["exchanges"]["kraken"]["maker_fee"] = "0.1.2";

    EXPECT_FALSE(config_manager->load_from_json(json));
    EXPECT_NE(config_manager->last_error().find("Error reading configuration"), std::string::npos);
}

TEST_F(ConfigManagerTest, UnsupportedVersionRejected) {
    auto json = minimal_config();
    json["config_version"] = 2;

    EXPECT_FALSE(config_manager->load_from_json(json));
    EXPECT_EQ(config_manager->last_issues().front().field, "config_version");
}

TEST_F(ConfigManagerTest, MissingFileFails) {
    EXPECT_FALSE(config_manager->load("does_not_exist.json"));
    EXPECT_NE(config_manager->last_error().find("does_not_exist.json"), std::string::npos);
}

TEST_F(ConfigManagerTest, UnparsableFileFails) {
    {
        std::ofstream file(test_config_file);
        file << "{ not json";
    }
    EXPECT_FALSE(config_manager->load(test_config_file));
    EXPECT_NE(config_manager->last_error().find("Error parsing"), std::string::npos);
}

TEST_F(ConfigManagerTest, ReloadPublishesNewSnapshot) {
    write_config(minimal_config());
    ASSERT_TRUE(config_manager->load(test_config_file));
    auto before = config_manager->snapshot();

    auto json = minimal_config();
    json["exchanges"]["kraken"]["taker_fee"] = "0.004";
    write_config(json);
    ASSERT_TRUE(config_manager->reload());

    auto after = config_manager->snapshot();
    EXPECT_EQ(after->exchanges.at("kraken").taker_fee, dec("0.004"));
    // Snapshots already handed out never change.
    EXPECT_EQ(before->exchanges.at("kraken").taker_fee, dec("0.0026"));
}

TEST_F(ConfigManagerTest, FailedReloadKeepsCurrentSnapshot) {
    write_config(minimal_config());
    ASSERT_TRUE(config_manager->load(test_config_file));

    auto json = minimal_config();
    json["exchanges"]["kraken"]["taker_fee"] = "0.9";
    write_config(json);

    EXPECT_FALSE(config_manager->reload());
    EXPECT_EQ(config_manager->snapshot()->exchanges.at("kraken").taker_fee, dec("0.0026"));
}

TEST_F(ConfigManagerTest, ReloadWithoutFileFails) {
    EXPECT_FALSE(config_manager->reload());
    EXPECT_EQ(config_manager->last_error(), "No configuration file loaded");
}

TEST(ConfigTypesTest, EnvironmentLookup) {
    ::setenv("ARBX_TEST_VARIABLE", "present", 1);
    EXPECT_EQ(get_env_var("ARBX_TEST_VARIABLE"), "present");
    ::unsetenv("ARBX_TEST_VARIABLE");
    EXPECT_EQ(get_env_var("ARBX_TEST_VARIABLE"), "");
}
