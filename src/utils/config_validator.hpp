#pragma once

#include <string>
#include <vector>
#include "config_types.hpp"
#include "../core/result.hpp"

namespace arbx {

struct ConfigIssue {
    std::string field;
    std::string message;
    std::string value;
};

// Collects every range/consistency problem of a parsed EngineConfig.
class ConfigValidator {
public:
    using ValidationResult = Result<bool>;
    using ValidationIssues = std::vector<ConfigIssue>;

    ValidationResult validate_config(const EngineConfig& config);

    ValidationResult validate_app_config(const AppConfig& app);
    ValidationResult validate_logging_config(const LoggingConfig& logging);
    ValidationResult validate_universe_config(const UniverseConfig& universe);
    ValidationResult validate_exchange_config(const ExchangeConfig& exchange);
    ValidationResult validate_profit_config(const ProfitConfig& profit);
    ValidationResult validate_risk_config(const RiskConfig& risk);
    ValidationResult validate_execution_config(const ExecutionConfig& execution);
    ValidationResult validate_scheduler_config(const SchedulerConfig& scheduler);
    ValidationResult validate_health_config(const HealthConfig& health);
    ValidationResult validate_fees_config(const FeesConfig& fees);

    const ValidationIssues& get_issues() const { return issues_; }
    void clear_issues() { issues_.clear(); }

private:
    ValidationIssues issues_;

    bool validate_int_range(const std::string& field, int value, int min_value, int max_value);
    bool validate_decimal_range(const std::string& field, Decimal value, Decimal min_value, Decimal max_value);
    bool validate_non_empty(const std::string& field, const std::vector<std::string>& values);
    bool validate_enum_field(const std::string& field, const std::string& value,
                             const std::vector<std::string>& valid_values);
    bool validate_trading_pair(const std::string& field, const std::string& symbol);

    ValidationResult section_result(size_t issues_before, const std::string& section) const;
    void add_issue(const std::string& field, const std::string& message, const std::string& value = "");
};

} // namespace arbx
