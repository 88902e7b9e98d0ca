#pragma once
#include <string>

namespace evoloop {

struct RunOptions {
    std::string message;
    std::string type = "user";
    std::string model;            // overrides config.model
    double budget_usd = 0.0;      // per-task ceiling, 0 = ledger remaining
    std::string image_path;
    std::string reasoning_effort = "medium";
};

// One task end to end. Prints the final text; exit code 0 on success.
int cmd_run(const RunOptions& opts);

// Base64 of a file's bytes; throws std::runtime_error when unreadable.
std::string read_file_base64(const std::string& path);
std::string image_mime_for(const std::string& path);

} // namespace evoloop
