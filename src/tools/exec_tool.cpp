#include "exec_tool.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace evoloop {

bool is_dangerous_command(const std::string& cmd) {
    static const std::vector<std::string> blocked = {
        "rm -rf /", "rm -rf /*", "mkfs", "shutdown", "reboot", "halt", "poweroff",
        "dd if=", ":(){ :|:& };:"
    };
    std::string lower = cmd;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto& b : blocked) {
        if (lower.find(b) != std::string::npos) return true;
    }

    // rm with recursive and force flags whose first path argument is absolute
    auto rm_pos = lower.find("rm ");
    if (rm_pos != std::string::npos && (rm_pos == 0 || lower[rm_pos - 1] == ' ' || lower[rm_pos - 1] == ';')) {
        bool has_r = false, has_f = false;
        for (auto& tok : split(lower.substr(rm_pos + 3), ' ')) {
            if (tok.empty()) continue;
            if (tok.front() == '-') {
                has_r = has_r || tok.find('r') != std::string::npos;
                has_f = has_f || tok.find('f') != std::string::npos;
                continue;
            }
            return has_r && has_f && (tok.front() == '/' || tok.front() == '~');
        }
    }
    return false;
}

static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

static std::string exec_command(const std::string& cmd, const std::string& working_dir,
                                int timeout_sec, size_t max_output, const ToolContext& ctx) {
    std::string full_cmd = "cd " + shell_quote(working_dir) + " && timeout " +
                           std::to_string(timeout_sec) + " sh -c " + shell_quote(cmd) + " 2>&1";

    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) throw std::runtime_error("Failed to execute command");

    std::string result;
    char buffer[4096];
    bool truncated = false;
    while (fgets(buffer, sizeof(buffer), pipe)) {
        if (ctx.cancelled()) {
            truncated = true;
            result += "\n...[cancelled]";
            break;
        }
        result += buffer;
        if (result.size() > max_output) {
            result.resize(max_output);
            result += "\n...[truncated]";
            truncated = true;
            break;
        }
    }
    int status = pclose(pipe);
    if (WIFEXITED(status)) status = WEXITSTATUS(status);

    if (!truncated && result.empty()) result = "(no output)";
    result += "\n[exit code: " + std::to_string(status) + "]";
    return result;
}

void register_exec_tool(ToolRegistry& reg, size_t max_output) {
    ToolDef def;
    def.name = "run_shell";
    def.description = "Run a shell command in the repository (or a subdirectory of it).";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "cmd": {"type": "string"},
            "cwd": {"type": "string"},
            "timeout": {"type": "integer"}
        },
        "required": ["cmd"]
    })JSON");
    def.is_code_tool = true;
    def.timeout = std::chrono::seconds(360);

    def.func = [max_output](const ToolContext& ctx, const nlohmann::json& args) -> std::string {
        std::string command = args.value("cmd", "");
        if (command.empty()) throw std::runtime_error("No command provided");
        if (is_dangerous_command(command)) {
            throw std::runtime_error("Command blocked: potentially destructive operation");
        }

        std::string rel = safe_relpath(args.value("cwd", ""));
        std::string dir = rel.empty() ? ctx.repo_dir : ctx.repo_dir + "/" + rel;
        if (!fs::is_directory(dir)) throw std::runtime_error("Not a directory: " + dir);

        int timeout = args.value("timeout", 300);
        timeout = std::clamp(timeout, 1, 300);
        return exec_command(command, dir, timeout, max_output, ctx);
    };

    reg.register_tool(std::move(def));
}

} // namespace evoloop
