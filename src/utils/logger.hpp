#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "config_types.hpp"

namespace arbx {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static void initialize(const LoggingConfig& config, LogLevel level = LogLevel::INFO);
    static void shutdown();

    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->critical(fmt, std::forward<Args>(args)...);
        }
    }

    // Convenience methods for single string logging
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void critical(const std::string& msg);

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool is_enabled(LogLevel level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

// Structured logging for trading events
class TradingLogger {
public:
    static void log_opportunity(size_t path_id, const std::string& path,
                                const std::string& gross_pct, const std::string& net_pct);

    static void log_order_placed(const std::string& venue, const std::string& symbol,
                                 const std::string& order_id, const std::string& side,
                                 const std::string& quantity);

    static void log_order_filled(const std::string& venue, const std::string& symbol,
                                 const std::string& order_id, const std::string& filled_quantity,
                                 const std::string& avg_price);

    static void log_execution_finished(uint64_t execution_id, size_t path_id,
                                       const std::string& terminal_state,
                                       const std::string& realized_profit,
                                       const std::string& asset);

    static void log_risk_alert(const std::string& alert_type, const std::string& description);
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define ARBX_LOG_TRACE(...) arbx::Logger::trace(__VA_ARGS__)
#define ARBX_LOG_DEBUG(...) arbx::Logger::debug(__VA_ARGS__)
#define ARBX_LOG_INFO(...) arbx::Logger::info(__VA_ARGS__)
#define ARBX_LOG_WARN(...) arbx::Logger::warn(__VA_ARGS__)
#define ARBX_LOG_ERROR(...) arbx::Logger::error(__VA_ARGS__)
#define ARBX_LOG_CRITICAL(...) arbx::Logger::critical(__VA_ARGS__)

#define ARBX_SCOPED_TIMER(name) arbx::ScopedTimer scoped_timer_(name)

} // namespace arbx
