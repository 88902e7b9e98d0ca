#pragma once
#include "../tool_registry.hpp"

namespace evoloop {

// Destructive commands (rm -rf /, mkfs, shutdown, ...) are refused.
bool is_dangerous_command(const std::string& cmd);

void register_exec_tool(ToolRegistry& reg, size_t max_output = 15000);

} // namespace evoloop
