#include "mcp_types.hpp"
#include <stdexcept>

namespace mcplink {

ToolInfo ToolInfo::from_json(const nlohmann::json& j) {
    ToolInfo t;
    t.name = j.value("name", "");
    t.description = j.value("description", "");
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        t.input_schema = j["inputSchema"];
    } else {
        t.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    }
    return t;
}

InitializeResult InitializeResult::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("initialize result is not an object");
    }
    InitializeResult r;
    r.protocol_version = j.value("protocolVersion", "");
    if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
        r.server_info.name = j["serverInfo"].value("name", "");
        r.server_info.version = j["serverInfo"].value("version", "");
    }
    if (j.contains("capabilities") && j["capabilities"].is_object()) {
        r.capabilities = j["capabilities"];
    } else {
        r.capabilities = nlohmann::json::object();
    }
    return r;
}

std::string CallToolResult::text() const {
    std::string output;
    for (auto& item : content) {
        if (item.type != "text") continue;
        if (!output.empty()) output += "\n";
        output += item.text;
    }
    return output.empty() ? raw.dump() : output;
}

CallToolResult CallToolResult::from_json(const nlohmann::json& j) {
    CallToolResult r;
    r.raw = j;
    if (!j.is_object()) return r;

    if (j.contains("content") && j["content"].is_array()) {
        for (auto& item : j["content"]) {
            if (!item.is_object()) continue;
            ToolContent c;
            c.type = item.value("type", "");
            if (c.type == "text") c.text = item.value("text", "");
            r.content.push_back(std::move(c));
        }
    }
    if (j.contains("isError") && j["isError"].is_boolean()) {
        r.is_error = j["isError"].get<bool>();
    }
    return r;
}

std::vector<ToolInfo> parse_tool_list(const nlohmann::json& result) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        throw std::invalid_argument("tools/list result has no tools array");
    }
    std::vector<ToolInfo> tools;
    for (auto& t : result["tools"]) {
        if (!t.is_object()) continue;
        auto info = ToolInfo::from_json(t);
        if (!info.name.empty()) tools.push_back(std::move(info));
    }
    return tools;
}

nlohmann::json initialize_params() {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", kClientName}, {"version", kClientVersion}}}
    };
}

} // namespace mcplink
