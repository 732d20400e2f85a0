#pragma once
#include <string>

namespace mcplink {
int cmd_tools(const std::string& config_path);
int cmd_call(const std::string& config_path, const std::string& tool, const std::string& args_json);
} // namespace mcplink
