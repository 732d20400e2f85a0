#include "logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace mcplink {

static std::atomic<int> g_level{static_cast<int>(LogLevel::info)};
static std::mutex g_write_mutex;

void set_log_level(LogLevel level) {
    g_level = static_cast<int>(level);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::debug;
    if (s == "info")  return LogLevel::info;
    if (s == "warn" || s == "warning") return LogLevel::warn;
    if (s == "error") return LogLevel::error;
    return LogLevel::info; // fallback
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
    }
    return "info";
}

void log_line(LogLevel level, const std::string& tag, const std::string& message) {
    if (!log_enabled(level)) return;

    std::string line = "[" + tag + "] ";
    if (level == LogLevel::warn) line += "warning: ";
    else if (level == LogLevel::error) line += "error: ";
    line += message;
    line += '\n';

    // Reader threads of several servers log concurrently; keep lines whole
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line;
}

} // namespace mcplink
