#pragma once
#include <string>

namespace mcplink {
int cmd_init(const std::string& config_path);
} // namespace mcplink
