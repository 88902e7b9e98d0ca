#include "fs_tools.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace evoloop {

static std::string resolve_under(const std::string& root, const std::string& path) {
    if (root.empty()) throw std::runtime_error("root directory is not configured");
    std::string rel = safe_relpath(path);
    return rel.empty() ? root : root + "/" + rel;
}

static std::string read_text(const std::string& resolved, int offset, int limit, size_t max_output) {
    std::ifstream f(resolved);
    if (!f) throw std::runtime_error("Cannot read file: " + resolved);
    if (offset < 1) offset = 1;

    std::string result;
    std::string line;
    int line_num = 0;
    int collected = 0;
    while (std::getline(f, line)) {
        line_num++;
        if (line_num < offset) continue;
        if (limit > 0 && collected >= limit) break;
        result += line;
        result += '\n';
        collected++;
        if (result.size() > max_output) {
            result += "\n...[truncated at line " + std::to_string(line_num) + "]";
            break;
        }
    }
    if (result.empty() && line_num >= offset) return "(empty file)";
    if (result.empty()) {
        throw std::runtime_error("Offset " + std::to_string(offset) + " beyond file (" +
                                 std::to_string(line_num) + " lines)");
    }
    return result;
}

static std::string list_dir(const std::string& resolved, size_t max_output) {
    if (!fs::exists(resolved)) throw std::runtime_error("Path does not exist: " + resolved);
    if (!fs::is_directory(resolved)) throw std::runtime_error("Not a directory: " + resolved);

    std::vector<std::string> lines;
    for (auto& entry : fs::directory_iterator(resolved)) {
        std::string name = entry.path().filename().string();
        if (name == ".git") continue;
        std::error_code ec;
        if (entry.is_directory(ec)) {
            lines.push_back(name + "/");
        } else {
            auto size = entry.file_size(ec);
            lines.push_back(name + " (" + std::to_string(ec ? 0 : size) + " bytes)");
        }
    }
    std::sort(lines.begin(), lines.end());

    std::string result;
    size_t count = 0;
    for (auto& l : lines) {
        result += l + "\n";
        count++;
        if (result.size() > max_output) {
            result += "...[truncated, " + std::to_string(count) + " of " +
                      std::to_string(lines.size()) + " entries shown]\n";
            break;
        }
    }
    if (result.empty()) result = "(empty directory)";
    return result;
}

static nlohmann::json read_params() {
    return nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "path": {"type": "string"},
            "offset": {"type": "integer"},
            "limit": {"type": "integer"}
        },
        "required": ["path"]
    })JSON");
}

static nlohmann::json list_params() {
    return nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "dir": {"type": "string"}
        }
    })JSON");
}

void register_fs_tools(ToolRegistry& reg, size_t max_output) {
    // ── repo_read / drive_read ──
    for (bool repo : {true, false}) {
        ToolDef def;
        def.name = repo ? "repo_read" : "drive_read";
        def.description = repo
            ? "Read a file from the repository. Supports offset/limit for line ranges."
            : "Read a file from the drive (memory, logs, state).";
        def.parameters = read_params();
        def.policy = ToolPolicy::read_only_parallel;
        def.func = [repo, max_output](const ToolContext& ctx, const nlohmann::json& args) -> std::string {
            std::string path = args.value("path", "");
            if (path.empty()) throw std::runtime_error("path is required");
            std::string root = repo ? ctx.repo_dir : ctx.drive_root;
            return read_text(resolve_under(root, path), args.value("offset", 1),
                             args.value("limit", 0), max_output);
        };
        reg.register_tool(std::move(def));
    }

    // ── repo_list / drive_list ──
    for (bool repo : {true, false}) {
        ToolDef def;
        def.name = repo ? "repo_list" : "drive_list";
        def.description = repo ? "List a repository directory." : "List a drive directory.";
        def.parameters = list_params();
        def.policy = ToolPolicy::read_only_parallel;
        def.func = [repo, max_output](const ToolContext& ctx, const nlohmann::json& args) -> std::string {
            std::string root = repo ? ctx.repo_dir : ctx.drive_root;
            return list_dir(resolve_under(root, args.value("dir", ".")), max_output);
        };
        reg.register_tool(std::move(def));
    }

    // ── drive_write ──
    {
        ToolDef def;
        def.name = "drive_write";
        def.description = "Create, overwrite or append to a file on the drive.";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "path": {"type": "string"},
                "content": {"type": "string"},
                "mode": {"type": "string", "enum": ["overwrite", "append"]}
            },
            "required": ["path", "content"]
        })JSON");
        def.policy = ToolPolicy::stateful;
        def.func = [](const ToolContext& ctx, const nlohmann::json& args) -> std::string {
            std::string path = args.value("path", "");
            std::string content = args.value("content", "");
            std::string mode = args.value("mode", "overwrite");
            if (path.empty()) throw std::runtime_error("path is required");

            std::string resolved = resolve_under(ctx.drive_root, path);
            auto parent = fs::path(resolved).parent_path();
            if (!parent.empty()) fs::create_directories(parent);

            std::ofstream f(resolved, mode == "append" ? std::ios::app : std::ios::trunc);
            if (!f) throw std::runtime_error("Cannot write file: " + resolved);
            f << content;
            f.close();
            if (!f) throw std::runtime_error("Write failed: " + resolved);

            return (mode == "append" ? "Appended " : "Wrote ") + std::to_string(content.size()) +
                   " bytes to " + path;
        };
        reg.register_tool(std::move(def));
    }
}

} // namespace evoloop
