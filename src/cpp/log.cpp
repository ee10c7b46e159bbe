#include "log.h"

#include <fmt/format.h>

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace {

LogLevel level_from_env() {
    const char* value = std::getenv("PIPE_OPTIMIZER_LOG");
    if (value == nullptr || *value == '\0') {
        return LogLevel::Warn;
    }
    try {
        return parse_log_level(value);
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "[pipe_optimizer] warn: {}; using 'warn'\n", e.what());
        return LogLevel::Warn;
    }
}

std::atomic<int>& level_storage() {
    static std::atomic<int> level{static_cast<int>(level_from_env())};
    return level;
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Info:
            return "info";
        case LogLevel::Debug:
            return "debug";
        default:
            return "off";
    }
}

}  // namespace

LogLevel log_level() {
    return static_cast<LogLevel>(level_storage().load(std::memory_order_relaxed));
}

void set_log_level(LogLevel level) {
    level_storage().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel parse_log_level(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (unsigned char c : name) {
        key.push_back(static_cast<char>(std::tolower(c)));
    }
    if (key == "off") {
        return LogLevel::Off;
    }
    if (key == "warn" || key == "warning") {
        return LogLevel::Warn;
    }
    if (key == "info") {
        return LogLevel::Info;
    }
    if (key == "debug") {
        return LogLevel::Debug;
    }
    throw std::invalid_argument("Unknown log level: " + name);
}

bool log_enabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(log_level());
}

void log_write(LogLevel level, const std::string& message) {
    fmt::print(stderr, "[pipe_optimizer] {}: {}\n", level_tag(level), message);
}
