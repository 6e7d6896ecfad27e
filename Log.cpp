// Log.cpp
#include "Log.hpp"
#include <atomic>
#include <mutex>
#include <cstdio>

namespace GraphFlow {

namespace {
std::atomic<LogLevel> threshold{LogLevel::Info};
std::mutex writeMutex;

const char* tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "[DEBUG]";
        case LogLevel::Info: return "[INFO]";
        case LogLevel::Warn: return "[WARN]";
        case LogLevel::Error: return "[ERROR]";
        case LogLevel::Off: break;
    }
    return "";
}
} // namespace

void setLogLevel(LogLevel level) { threshold.store(level); }

LogLevel getLogLevel() { return threshold.load(); }

std::optional<LogLevel> parseLogLevel(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "off") return LogLevel::Off;
    return std::nullopt;
}

namespace detail {
void writeLog(LogLevel level, const std::string& message) {
    // players may log from their worker thread
    std::lock_guard<std::mutex> lock(writeMutex);
    fmt::print(stderr, "{} {}\n", tag(level), message);
}
} // namespace detail

} // namespace GraphFlow
