#pragma once
#include <string>

namespace mcplink {

enum class LogLevel {
    debug,
    info,
    warn,
    error
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Parse "debug" / "info" / "warn" / "error"; unknown strings fall back to info
LogLevel parse_log_level(const std::string& s);
const char* to_string(LogLevel level);

// Writes "[tag] message" to stderr as one line when level passes the filter
void log_line(LogLevel level, const std::string& tag, const std::string& message);

} // namespace mcplink
