// Log.hpp
//
// Minimal leveled logging on top of fmt. Messages go to stderr prefixed with
// the level tag ("[DEBUG] connect ..."), filtered by a process-wide
// threshold.
#pragma once
#include <fmt/core.h>
#include <string>
#include <optional>
#include <utility>

namespace GraphFlow {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
// "debug", "info", "warn", "error", "off"
std::optional<LogLevel> parseLogLevel(const std::string& s);

namespace detail {
void writeLog(LogLevel level, const std::string& message);
}

template <typename... Args>
void logAt(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (level < getLogLevel()) return;
    detail::writeLog(level, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Error, format, std::forward<Args>(args)...);
}

} // namespace GraphFlow
