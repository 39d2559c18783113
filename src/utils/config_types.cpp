#include "config_types.hpp"
#include <cstdlib>

namespace arbx {

std::string get_env_var(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    return val == nullptr ? std::string("") : std::string(val);
}

void to_json(nlohmann::json& j, const EngineConfig& config) {
    j = nlohmann::json{
        {"config_version", config.config_version},
        {"app", config.app},
        {"logging", config.logging},
        {"universe", config.universe},
        {"exchanges", config.exchanges},
        {"profit", config.profit},
        {"risk", config.risk},
        {"execution", config.execution},
        {"scheduler", config.scheduler},
        {"health", config.health},
        {"fees", config.fees}
    };
}

// Sections other than "exchanges" are optional and keep their defaults.
void from_json(const nlohmann::json& j, EngineConfig& config) {
    j.at("config_version").get_to(config.config_version);

    if (j.contains("app")) {
        j["app"].get_to(config.app);
    }
    if (j.contains("logging")) {
        j["logging"].get_to(config.logging);
    }
    if (j.contains("universe")) {
        j["universe"].get_to(config.universe);
    }

    config.exchanges.clear();
    for (auto& [name, section] : j.at("exchanges").items()) {
        ExchangeConfig exchange_cfg = section.get<ExchangeConfig>();
        exchange_cfg.name = name;
        config.exchanges[name] = exchange_cfg;
    }

    if (j.contains("profit")) {
        j["profit"].get_to(config.profit);
    }
    if (j.contains("risk")) {
        j["risk"].get_to(config.risk);
    }
    if (j.contains("execution")) {
        j["execution"].get_to(config.execution);
    }
    if (j.contains("scheduler")) {
        j["scheduler"].get_to(config.scheduler);
    }
    if (j.contains("health")) {
        j["health"].get_to(config.health);
    }
    if (j.contains("fees")) {
        j["fees"].get_to(config.fees);
    }
}

} // namespace arbx
