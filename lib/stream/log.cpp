// SPDX-License-Identifier: MIT

// lib/stream/log.cpp
#include "lib/stream/log.hpp"

#include <cstdio>
#include <mutex>

namespace multistream {

namespace {

struct LogState {
    std::mutex mutex;
    LogLevel level = LogLevel::Warn;
    LogHandler handler;
};

LogState& State() {
    static LogState state;
    return state;
}

}  // namespace

void SetLogLevel(LogLevel level) {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.level = level;
}

LogLevel GetLogLevel() {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.level;
}

void SetLogHandler(LogHandler handler) {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.handler = std::move(handler);
}

bool LogEnabled(LogLevel level) {
    if (level == LogLevel::Off) return false;
    return level >= GetLogLevel();
}

void LogMessage(LogLevel level, std::string_view component, std::string_view message) {
    LogHandler handler;
    {
        auto& state = State();
        std::lock_guard<std::mutex> lock(state.mutex);
        handler = state.handler;
    }

    // Handler runs outside the lock so it may log or reconfigure
    if (handler) {
        handler(level, component, message);
        return;
    }
    fmt::print(stderr, "[{}] {}: {}\n", log_level_name(level), component, message);
}

}  // namespace multistream
