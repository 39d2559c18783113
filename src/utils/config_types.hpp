#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/decimal.hpp"

namespace arbx {

constexpr int CONFIG_VERSION = 1;

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name = "arbx";
    std::string version = "1.0.0";
    std::string log_level = "INFO";
    bool paper_trading = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AppConfig, name, version, log_level, paper_trading)

struct LoggingConfig {
    std::string file_path = "logs/arbx.log";
    int max_file_size_mb = 10;
    int max_backup_files = 3;
    bool console_output = true;
    bool file_output = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LoggingConfig, file_path, max_file_size_mb, max_backup_files, console_output, file_output)

// Traded assets and the stablecoins they are quoted in.
struct UniverseConfig {
    std::vector<std::string> assets = {"BTC", "ETH", "SOL"};
    std::vector<std::string> stablecoins = {"USDT", "USDC", "USD"};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(UniverseConfig, assets, stablecoins)

// `name` comes from the key under "exchanges".
struct ExchangeConfig {
    std::string name;
    bool enabled = true;
    std::vector<std::string> markets;
    Decimal maker_fee = Decimal::from_string("0.001");
    Decimal taker_fee = Decimal::from_string("0.001");
    Decimal fee_discount_pct;
    int fill_timeout_ms = 30000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ExchangeConfig, enabled, markets, maker_fee, taker_fee, fee_discount_pct, fill_timeout_ms)

struct ProfitConfig {
    Decimal assumed_slippage_pct;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ProfitConfig, assumed_slippage_pct)

struct RiskConfig {
    Decimal base_threshold_pct = Decimal::from_string("0.5");
    Decimal min_threshold_pct = Decimal::from_string("0.4");
    Decimal max_threshold_pct = Decimal::from_string("1.0");
    Decimal volatility_sensitivity = Decimal::from_string("0.1");
    Decimal imbalance_sensitivity = Decimal::from_string("0.2");
    Decimal depth_multiple = Decimal::from_string("2.5");
    int depth_levels = 5;
    int volatility_window = 20;
    Decimal volatility_band_pct = Decimal::from_string("2.0");
    std::map<std::string, Decimal> min_trade_size;
    std::map<std::string, Decimal> max_trade_size;
    std::map<std::string, Decimal> max_daily_loss;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RiskConfig, base_threshold_pct, min_threshold_pct, max_threshold_pct,
                                   volatility_sensitivity, imbalance_sensitivity, depth_multiple, depth_levels,
                                   volatility_window, volatility_band_pct, min_trade_size, max_trade_size,
                                   max_daily_loss)

struct ExecutionConfig {
    Decimal partial_fill_tolerance_pct = Decimal::from_string("0.5");
    int fresh_book_timeout_ms = 2000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ExecutionConfig, partial_fill_tolerance_pct, fresh_book_timeout_ms)

struct SchedulerConfig {
    int worker_threads = 4;
    int cross_venue_interval_ms = 10000;
    int triangular_interval_ms = 30000;
    int min_scan_spacing_ms = 250;
    int freshness_window_ms = 2000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SchedulerConfig, worker_threads, cross_venue_interval_ms, triangular_interval_ms,
                                   min_scan_spacing_ms, freshness_window_ms)

// Venue health is judged over the last `window` order outcomes, forgetting
// outcomes older than `window_ms`.
struct HealthConfig {
    int window = 20;
    int window_ms = 600000;
    int min_samples = 5;
    Decimal degraded_error_rate_pct = Decimal::from_int(10);
    Decimal unhealthy_error_rate_pct = Decimal::from_int(30);
    int slow_fill_ms = 5000;
    int degraded_slowdown = 4;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(HealthConfig, window, window_ms, min_samples, degraded_error_rate_pct,
                                   unhealthy_error_rate_pct, slow_fill_ms, degraded_slowdown)

struct FeesConfig {
    int refresh_interval_ms = 300000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FeesConfig, refresh_interval_ms)

// Immutable once published by ConfigManager.
struct EngineConfig {
    int config_version = CONFIG_VERSION;
    AppConfig app;
    LoggingConfig logging;
    UniverseConfig universe;
    std::map<std::string, ExchangeConfig> exchanges;
    ProfitConfig profit;
    RiskConfig risk;
    ExecutionConfig execution;
    SchedulerConfig scheduler;
    HealthConfig health;
    FeesConfig fees;
};

void to_json(nlohmann::json& j, const EngineConfig& config);
void from_json(const nlohmann::json& j, EngineConfig& config);

} // namespace arbx
