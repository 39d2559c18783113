#include "config_manager.hpp"
#include <fstream>
#include "logger.hpp"

namespace arbx {

ConfigManager::ConfigManager()
    : current_(std::make_shared<const EngineConfig>()) {}

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        last_error_ = "Failed to open config file: " + file_path;
        Logger::error(last_error_);
        return false;
    }

    nlohmann::json config_data;
    try {
        file >> config_data;
    } catch (const nlohmann::json::exception& e) {
        last_error_ = "Error parsing config file: " + std::string(e.what());
        Logger::error(last_error_);
        return false;
    }

    if (!load_from_json(config_data)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_path_ = file_path;
    }
    ARBX_LOG_INFO("Configuration loaded from {}", file_path);
    return true;
}

bool ConfigManager::load_from_json(const nlohmann::json& config_data) {
    last_issues_.clear();
    last_error_.clear();

    EngineConfig config;
    try {
        config_data.get_to(config);
    } catch (const nlohmann::json::exception& e) {
        last_error_ = "Error reading configuration: " + std::string(e.what());
        Logger::error(last_error_);
        return false;
    } catch (const std::invalid_argument& e) {
        // Malformed decimal strings
        last_error_ = "Error reading configuration: " + std::string(e.what());
        Logger::error(last_error_);
        return false;
    } catch (const std::overflow_error& e) {
        last_error_ = "Error reading configuration: " + std::string(e.what());
        Logger::error(last_error_);
        return false;
    }

    ConfigValidator validator;
    auto result = validator.validate_config(config);
    if (result.is_error()) {
        last_issues_ = validator.get_issues();
        last_error_ = result.error();
        for (const auto& issue : last_issues_) {
            ARBX_LOG_ERROR("Config issue | {} | {} | value='{}'", issue.field, issue.message, issue.value);
        }
        return false;
    }

    publish(std::move(config));
    return true;
}

bool ConfigManager::reload() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = file_path_;
    }
    if (path.empty()) {
        last_error_ = "No configuration file loaded";
        Logger::warn(last_error_);
        return false;
    }
    return load(path);
}

ConfigManager::Snapshot ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ConfigManager::publish(EngineConfig config) {
    auto next = std::make_shared<const EngineConfig>(std::move(config));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
}

} // namespace arbx
