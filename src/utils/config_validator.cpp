#include "config_validator.hpp"
#include "../core/exceptions.hpp"
#include "../core/types.hpp"

#include <algorithm>
#include <set>

namespace arbx {

namespace {

const Decimal kMaxFeeRate = Decimal::from_string("0.1");
const Decimal kMaxSlippagePct = Decimal::from_int(5);

} // namespace

ConfigValidator::ValidationResult ConfigValidator::validate_config(const EngineConfig& config) {
    clear_issues();

    if (config.config_version != CONFIG_VERSION) {
        add_issue("config_version", "Unsupported configuration version", std::to_string(config.config_version));
    }

    validate_app_config(config.app);
    validate_logging_config(config.logging);
    validate_universe_config(config.universe);

    size_t enabled = 0;
    for (const auto& [name, exchange] : config.exchanges) {
        validate_exchange_config(exchange);
        if (exchange.enabled) {
            ++enabled;
        }
    }
    if (enabled == 0) {
        add_issue("exchanges", "At least one enabled exchange is required");
    }

    validate_profit_config(config.profit);
    validate_risk_config(config.risk);
    validate_execution_config(config.execution);
    validate_scheduler_config(config.scheduler);
    validate_health_config(config.health);
    validate_fees_config(config.fees);

    if (!issues_.empty()) {
        return ValidationResult::error(std::to_string(issues_.size()) + " configuration issue(s), first: " +
                                       issues_.front().field + ": " + issues_.front().message);
    }
    return ValidationResult::success(true);
}

ConfigValidator::ValidationResult ConfigValidator::validate_app_config(const AppConfig& app) {
    size_t before = issues_.size();
    if (app.name.empty()) {
        add_issue("app.name", "Required field is empty");
    }
    validate_enum_field("app.log_level", app.log_level,
                        {"TRACE", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "CRITICAL"});
    return section_result(before, "app");
}

ConfigValidator::ValidationResult ConfigValidator::validate_logging_config(const LoggingConfig& logging) {
    size_t before = issues_.size();
    if (logging.file_output) {
        if (logging.file_path.empty()) {
            add_issue("logging.file_path", "File output enabled without a file path");
        }
        validate_int_range("logging.max_file_size_mb", logging.max_file_size_mb, 1, 1024);
        validate_int_range("logging.max_backup_files", logging.max_backup_files, 1, 100);
    }
    return section_result(before, "logging");
}

ConfigValidator::ValidationResult ConfigValidator::validate_universe_config(const UniverseConfig& universe) {
    size_t before = issues_.size();
    validate_non_empty("universe.assets", universe.assets);
    validate_non_empty("universe.stablecoins", universe.stablecoins);

    std::set<std::string> seen;
    for (const auto* list : {&universe.assets, &universe.stablecoins}) {
        for (const auto& asset : *list) {
            if (asset.empty()) {
                add_issue("universe", "Empty asset symbol");
            } else if (!seen.insert(asset).second) {
                add_issue("universe", "Asset declared twice", asset);
            }
        }
    }
    return section_result(before, "universe");
}

ConfigValidator::ValidationResult ConfigValidator::validate_exchange_config(const ExchangeConfig& exchange) {
    size_t before = issues_.size();
    std::string prefix = "exchanges." + exchange.name;

    if (exchange.enabled) {
        validate_non_empty(prefix + ".markets", exchange.markets);
    }
    for (const auto& market : exchange.markets) {
        validate_trading_pair(prefix + ".markets", market);
    }
    validate_decimal_range(prefix + ".maker_fee", exchange.maker_fee, Decimal::zero(), kMaxFeeRate);
    validate_decimal_range(prefix + ".taker_fee", exchange.taker_fee, Decimal::zero(), kMaxFeeRate);
    validate_decimal_range(prefix + ".fee_discount_pct", exchange.fee_discount_pct, Decimal::zero(),
                           Decimal::hundred());
    validate_int_range(prefix + ".fill_timeout_ms", exchange.fill_timeout_ms, 1, 600000);
    return section_result(before, prefix);
}

ConfigValidator::ValidationResult ConfigValidator::validate_profit_config(const ProfitConfig& profit) {
    size_t before = issues_.size();
    validate_decimal_range("profit.assumed_slippage_pct", profit.assumed_slippage_pct, Decimal::zero(),
                           kMaxSlippagePct);
    return section_result(before, "profit");
}

ConfigValidator::ValidationResult ConfigValidator::validate_risk_config(const RiskConfig& risk) {
    size_t before = issues_.size();

    validate_decimal_range("risk.min_threshold_pct", risk.min_threshold_pct, Decimal::zero(), Decimal::hundred());
    validate_decimal_range("risk.max_threshold_pct", risk.max_threshold_pct, Decimal::zero(), Decimal::hundred());
    if (risk.min_threshold_pct > risk.max_threshold_pct) {
        add_issue("risk.min_threshold_pct", "Minimum threshold exceeds maximum threshold",
                  risk.min_threshold_pct.to_string());
    } else {
        validate_decimal_range("risk.base_threshold_pct", risk.base_threshold_pct,
                               risk.min_threshold_pct, risk.max_threshold_pct);
    }

    validate_decimal_range("risk.volatility_sensitivity", risk.volatility_sensitivity, Decimal::zero(),
                           Decimal::hundred());
    validate_decimal_range("risk.imbalance_sensitivity", risk.imbalance_sensitivity, Decimal::zero(),
                           Decimal::hundred());
    validate_decimal_range("risk.depth_multiple", risk.depth_multiple, Decimal::from_string("2.5"),
                           Decimal::from_int(5));
    validate_int_range("risk.depth_levels", risk.depth_levels, 1, 50);
    validate_int_range("risk.volatility_window", risk.volatility_window, 2, 10000);
    validate_decimal_range("risk.volatility_band_pct", risk.volatility_band_pct, Decimal::zero(),
                           Decimal::hundred());

    for (const auto& [asset, size] : risk.max_trade_size) {
        if (!size.is_positive()) {
            add_issue("risk.max_trade_size." + asset, "Must be positive", size.to_string());
        }
        auto min_it = risk.min_trade_size.find(asset);
        if (min_it != risk.min_trade_size.end() && min_it->second > size) {
            add_issue("risk.min_trade_size." + asset, "Exceeds max_trade_size", min_it->second.to_string());
        }
    }
    for (const auto& [asset, size] : risk.min_trade_size) {
        if (size.is_negative()) {
            add_issue("risk.min_trade_size." + asset, "Must not be negative", size.to_string());
        }
    }
    for (const auto& [asset, limit] : risk.max_daily_loss) {
        if (!limit.is_positive()) {
            add_issue("risk.max_daily_loss." + asset, "Must be positive", limit.to_string());
        }
    }
    return section_result(before, "risk");
}

ConfigValidator::ValidationResult ConfigValidator::validate_execution_config(const ExecutionConfig& execution) {
    size_t before = issues_.size();
    validate_decimal_range("execution.partial_fill_tolerance_pct", execution.partial_fill_tolerance_pct,
                           Decimal::zero(), Decimal::from_int(10));
    validate_int_range("execution.fresh_book_timeout_ms", execution.fresh_book_timeout_ms, 0, 60000);
    return section_result(before, "execution");
}

ConfigValidator::ValidationResult ConfigValidator::validate_scheduler_config(const SchedulerConfig& scheduler) {
    size_t before = issues_.size();
    validate_int_range("scheduler.worker_threads", scheduler.worker_threads, 1, 64);
    validate_int_range("scheduler.cross_venue_interval_ms", scheduler.cross_venue_interval_ms, 1, 3600000);
    validate_int_range("scheduler.triangular_interval_ms", scheduler.triangular_interval_ms, 1, 3600000);
    validate_int_range("scheduler.min_scan_spacing_ms", scheduler.min_scan_spacing_ms, 0, 3600000);
    validate_int_range("scheduler.freshness_window_ms", scheduler.freshness_window_ms, 1, 600000);
    return section_result(before, "scheduler");
}

ConfigValidator::ValidationResult ConfigValidator::validate_health_config(const HealthConfig& health) {
    size_t before = issues_.size();
    validate_int_range("health.window", health.window, 1, 1000);
    validate_int_range("health.window_ms", health.window_ms, 1000, 86400000);
    validate_int_range("health.min_samples", health.min_samples, 1, health.window);
    validate_decimal_range("health.degraded_error_rate_pct", health.degraded_error_rate_pct, Decimal::zero(),
                           Decimal::hundred());
    validate_decimal_range("health.unhealthy_error_rate_pct", health.unhealthy_error_rate_pct,
                           health.degraded_error_rate_pct, Decimal::hundred());
    validate_int_range("health.slow_fill_ms", health.slow_fill_ms, 1, 600000);
    validate_int_range("health.degraded_slowdown", health.degraded_slowdown, 1, 100);
    return section_result(before, "health");
}

ConfigValidator::ValidationResult ConfigValidator::validate_fees_config(const FeesConfig& fees) {
    size_t before = issues_.size();
    validate_int_range("fees.refresh_interval_ms", fees.refresh_interval_ms, 1000, 86400000);
    return section_result(before, "fees");
}

bool ConfigValidator::validate_int_range(const std::string& field, int value, int min_value, int max_value) {
    if (value < min_value || value > max_value) {
        add_issue(field, "Value out of range [" + std::to_string(min_value) + ", " +
                         std::to_string(max_value) + "]", std::to_string(value));
        return false;
    }
    return true;
}

bool ConfigValidator::validate_decimal_range(const std::string& field, Decimal value,
                                             Decimal min_value, Decimal max_value) {
    if (value < min_value || value > max_value) {
        add_issue(field, "Value out of range [" + min_value.to_string() + ", " + max_value.to_string() + "]",
                  value.to_string());
        return false;
    }
    return true;
}

bool ConfigValidator::validate_non_empty(const std::string& field, const std::vector<std::string>& values) {
    if (values.empty()) {
        add_issue(field, "List must not be empty");
        return false;
    }
    return true;
}

bool ConfigValidator::validate_enum_field(const std::string& field, const std::string& value,
                                          const std::vector<std::string>& valid_values) {
    if (std::find(valid_values.begin(), valid_values.end(), value) == valid_values.end()) {
        add_issue(field, "Invalid value", value);
        return false;
    }
    return true;
}

bool ConfigValidator::validate_trading_pair(const std::string& field, const std::string& symbol) {
    try {
        Pair pair = Pair::parse(symbol);
        if (pair.base == pair.quote) {
            add_issue(field, "Pair base equals quote", symbol);
            return false;
        }
    } catch (const ValidationError& e) {
        add_issue(field, e.what(), symbol);
        return false;
    }
    return true;
}

ConfigValidator::ValidationResult ConfigValidator::section_result(size_t issues_before,
                                                                  const std::string& section) const {
    return issues_.size() == issues_before ? ValidationResult::success(true)
                                           : ValidationResult::error(section + " configuration validation failed");
}

void ConfigValidator::add_issue(const std::string& field, const std::string& message, const std::string& value) {
    issues_.push_back(ConfigIssue{field, message, value});
}

} // namespace arbx
