// SPDX-License-Identifier: MIT

// lib/stream/log.hpp
#pragma once

#include <functional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace multistream {

/// Severity of a log record. Records below the threshold are not formatted.
enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off,    ///< Threshold only: suppresses every record
};

/// Receives every record at or above the threshold.
///
/// The default handler writes "[level] component: message" lines to stderr.
using LogHandler = std::function<void(LogLevel level,
                                      std::string_view component,
                                      std::string_view message)>;

/// Return the lowercase name of a level ("debug", "warn", ...).
constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

/// Set the minimum level that is emitted (default LogLevel::Warn).
void SetLogLevel(LogLevel level);

/// Current minimum level.
LogLevel GetLogLevel();

/// Replace the stderr writer. Passing an empty handler restores it.
void SetLogHandler(LogHandler handler);

/// True if a record at @p level would be emitted.
bool LogEnabled(LogLevel level);

/// Emit an already formatted record.
void LogMessage(LogLevel level, std::string_view component, std::string_view message);

/// Format with {fmt} and emit, skipping the formatting when disabled.
template <typename... Args>
void Log(LogLevel level, std::string_view component,
         fmt::format_string<Args...> format, Args&&... args) {
    if (!LogEnabled(level)) return;
    LogMessage(level, component, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace multistream
