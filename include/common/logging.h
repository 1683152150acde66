#pragma once

#include "common/errors.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

namespace tradeguard {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Accepted operations log at DEBUG; authority actions and settlements log at
 * INFO. Debug logging should stay disabled in production replays.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * @brief Structured log entry for JSON logging
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Parse a level name such as "info" or "WARN"
 * @return The level, or nullopt for an unknown name
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Global logging configuration
 *
 * Thread-safe logging configuration that can be adjusted at runtime.
 * Hot paths should check is_enabled() before formatting strings; the LOG_*
 * macros do this for DEBUG and TRACE.
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Set current logging level
    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect output (defaults to std::cout); nullptr restores the default
    void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        out_ = out ? out : &std::cout;
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            oss.str(),
            "",
            {}
        };

        output_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                       const std::string& message, const std::string& error_code = "",
                       const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            message,
            error_code,
            context
        };

        output_log_entry(entry);
    }

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), out_(&std::cout) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::mutex output_mutex_;
    std::ostream* out_;

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(output_mutex_);
        *out_ << line << std::endl;
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;
    std::string level_to_string(LogLevel level) const;
    std::string escape_json_string(const std::string& input) const;
};

} // namespace common
} // namespace tradeguard

/**
 * @brief Performance-conscious logging macros
 *
 * The first argument is the module name ("registry", "escrow", ...).
 */
#define LOG_TRACE(...) \
    do { \
        if (tradeguard::common::Logger::instance().is_enabled(tradeguard::common::LogLevel::TRACE)) { \
            tradeguard::common::Logger::instance().log(tradeguard::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (tradeguard::common::Logger::instance().is_debug_enabled()) { \
            tradeguard::common::Logger::instance().log(tradeguard::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    tradeguard::common::Logger::instance().log(tradeguard::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    tradeguard::common::Logger::instance().log(tradeguard::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    tradeguard::common::Logger::instance().log(tradeguard::common::LogLevel::ERROR, __VA_ARGS__)

/**
 * @brief Structured logging macros for rejections and settlements
 */
#define LOG_STRUCTURED(level, module, message, ...) \
    tradeguard::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

#define LOG_REJECTED(module, operation, kind) \
    do { \
        if (tradeguard::common::Logger::instance().is_debug_enabled()) { \
            tradeguard::common::Logger::instance().log_structured( \
                tradeguard::common::LogLevel::DEBUG, module, \
                std::string(operation) + " rejected", \
                tradeguard::common::to_string(kind)); \
        } \
    } while(0)
