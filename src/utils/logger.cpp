#include "logger.hpp"

#include <filesystem>
#include <iostream>
#include <vector>

namespace arbx {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel parse_log_level(const std::string& name) {
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "WARN" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::initialize(const LoggingConfig& config, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        if (config.file_output && !config.file_path.empty()) {
            std::filesystem::path log_path(config.file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024,
                static_cast<size_t>(config.max_backup_files));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (logger_) {
            spdlog::drop(logger_->name());
        }
        logger_ = std::make_shared<spdlog::logger>("arbx", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(level));
        current_level_ = level;

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        logger_->flush_on(spdlog::level::warn);
        spdlog::flush_every(std::chrono::seconds(3));

        Logger::info("Logger initialized");
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_ = nullptr;
    }
}

void Logger::trace(const std::string& msg) {
    if (logger_) logger_->trace(msg);
}

void Logger::debug(const std::string& msg) {
    if (logger_) logger_->debug(msg);
}

void Logger::info(const std::string& msg) {
    if (logger_) logger_->info(msg);
}

void Logger::warn(const std::string& msg) {
    if (logger_) logger_->warn(msg);
}

void Logger::error(const std::string& msg) {
    if (logger_) logger_->error(msg);
}

void Logger::critical(const std::string& msg) {
    if (logger_) logger_->critical(msg);
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(current_level_);
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void TradingLogger::log_opportunity(size_t path_id, const std::string& path,
                                    const std::string& gross_pct, const std::string& net_pct) {
    Logger::info("OPPORTUNITY | Path: {} {} | Gross: {}% | Net: {}%", path_id, path, gross_pct, net_pct);
}

void TradingLogger::log_order_placed(const std::string& venue, const std::string& symbol,
                                     const std::string& order_id, const std::string& side,
                                     const std::string& quantity) {
    Logger::info("ORDER_PLACED | Venue: {} | Symbol: {} | OrderID: {} | Side: {} | Qty: {}",
                 venue, symbol, order_id, side, quantity);
}

void TradingLogger::log_order_filled(const std::string& venue, const std::string& symbol,
                                     const std::string& order_id, const std::string& filled_quantity,
                                     const std::string& avg_price) {
    Logger::info("ORDER_FILLED | Venue: {} | Symbol: {} | OrderID: {} | FilledQty: {} | AvgPrice: {}",
                 venue, symbol, order_id, filled_quantity, avg_price);
}

void TradingLogger::log_execution_finished(uint64_t execution_id, size_t path_id,
                                           const std::string& terminal_state,
                                           const std::string& realized_profit,
                                           const std::string& asset) {
    Logger::info("EXECUTION_FINISHED | ExecutionID: {} | Path: {} | State: {} | PnL: {} {}",
                 execution_id, path_id, terminal_state, realized_profit, asset);
}

void TradingLogger::log_risk_alert(const std::string& alert_type, const std::string& description) {
    Logger::warn("RISK_ALERT | Type: {} | Description: {}", alert_type, description);
}

ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);
    Logger::debug("TIMER | Operation: {} | Duration: {} us", operation_name_, duration.count());
}

} // namespace arbx
