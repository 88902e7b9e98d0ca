#pragma once
#include "../tool_registry.hpp"

namespace evoloop {

// repo_read, repo_list, drive_read, drive_list, drive_write. Paths are
// relative to the repo or drive root and may not escape it.
void register_fs_tools(ToolRegistry& reg, size_t max_output = 15000);

} // namespace evoloop
