#pragma once
#include "config.hpp"
#include <string>
#include <vector>

namespace evoloop {

// Configuration, budget and recent spend.
int cmd_status();

// Estimated cost of one call: MODEL PROMPT COMPLETION [CACHED].
int cmd_cost(const std::vector<std::string>& args);

} // namespace evoloop
