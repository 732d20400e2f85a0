#pragma once
#include <string>
#include <cstdlib>
#include <filesystem>

namespace mcplink {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.mcplink/config.json";
}

// Truncate long wire frames for log lines
inline std::string clip(const std::string& s, size_t max_chars = 300) {
    if (s.size() <= max_chars) return s;
    return s.substr(0, max_chars) + "...";
}

} // namespace mcplink
