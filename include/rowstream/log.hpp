/**
 * @file log.hpp
 * @brief Library-wide logging hook
 *
 * Messages go to the function installed with set_log_func(). Without one,
 * messages at or above the current level are written to stderr:
 *
 *   [rowstream] cancel requested, 3 rows buffered
 *
 * Usage:
 *   rowstream::set_log_level(rowstream::LogLevel::debug);
 *   rowstream::set_log_func([](rowstream::LogLevel, const std::string& msg) {
 *       my_logger.info(msg);
 *   });
 */

#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace rowstream {

enum class LogLevel {
    debug,
    info,
    warn,
    error
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
    }
    return "info";
}

using log_func_t = std::function<void(LogLevel level, const std::string& msg)>;

namespace detail {

struct LogConfig {
    log_func_t func;
    LogLevel level = LogLevel::warn;
};

inline LogConfig& log_config() {
    static LogConfig config;
    return config;
}

} // namespace detail

/// Install a log sink. Pass an empty function to restore the stderr default.
inline void set_log_func(log_func_t func) {
    detail::log_config().func = std::move(func);
}

/// Minimum level that is forwarded to the sink.
inline void set_log_level(LogLevel level) {
    detail::log_config().level = level;
}

inline LogLevel log_level() {
    return detail::log_config().level;
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(detail::log_config().level);
}

inline void log(LogLevel level, const std::string& msg) {
    if (!log_enabled(level)) return;

    auto& config = detail::log_config();
    if (config.func) {
        config.func(level, msg);
    } else {
        std::cerr << "[rowstream] " << msg << std::endl;
    }
}

} // namespace rowstream
