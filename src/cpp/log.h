#pragma once

#include <fmt/core.h>

#include <string>
#include <utility>

enum class LogLevel {
    Off = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

LogLevel log_level();
void set_log_level(LogLevel level);

// Accepts "off", "warn", "info", "debug" (any case).
LogLevel parse_log_level(const std::string& name);

bool log_enabled(LogLevel level);

void log_write(LogLevel level, const std::string& message);

template <typename... Args>
void log_warn(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::Warn)) {
        log_write(LogLevel::Warn, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::Info)) {
        log_write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args) {
    if (log_enabled(LogLevel::Debug)) {
        log_write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}
