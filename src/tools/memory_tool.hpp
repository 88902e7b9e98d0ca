#pragma once
#include "../tool_registry.hpp"

namespace evoloop {

// update_scratchpad, update_identity, knowledge_read, knowledge_write.
// Writes go through the sticky lane so they never interleave.
void register_memory_tools(ToolRegistry& reg);

} // namespace evoloop
