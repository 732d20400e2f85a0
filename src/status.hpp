#pragma once
#include "config.hpp"
#include <string>

namespace mcplink {
int cmd_status(const std::string& config_path);
} // namespace mcplink
