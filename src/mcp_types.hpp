#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcplink {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kClientName = "mcplink";
constexpr const char* kClientVersion = "1.0.0";

struct ToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    static ToolInfo from_json(const nlohmann::json& j);
};

struct ServerInfo {
    std::string name;
    std::string version;
};

struct InitializeResult {
    std::string protocol_version;
    ServerInfo server_info;
    nlohmann::json capabilities;

    // Throws std::invalid_argument when the result is not an object
    static InitializeResult from_json(const nlohmann::json& j);
};

struct ToolContent {
    std::string type;   // "text", "image", "resource", ...
    std::string text;   // only for type == "text"
};

// Outcome of a tools/call that reached the server. is_error means the tool
// ran and reported a failure; that is application data, not a call failure.
struct CallToolResult {
    nlohmann::json raw;
    std::vector<ToolContent> content;
    bool is_error = false;

    // Text items joined with newlines; the raw JSON when there are none
    std::string text() const;

    static CallToolResult from_json(const nlohmann::json& j);
};

// Throws std::invalid_argument when "tools" is missing or not an array
std::vector<ToolInfo> parse_tool_list(const nlohmann::json& result);

nlohmann::json initialize_params();

} // namespace mcplink
