#pragma once
#include "event_log.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace evoloop {

// How the dispatcher may run a tool.
enum class ToolPolicy {
    single_shot,          // fresh slot per call
    read_only_parallel,   // may share a parallel batch with other read-only tools
    stateful              // pinned to the sticky lane, one call at a time
};

using CancelToken = std::shared_ptr<std::atomic_bool>;

inline CancelToken make_cancel_token() {
    return std::make_shared<std::atomic_bool>(false);
}

struct ToolContext {
    std::string repo_dir;
    std::string drive_root;
    std::string task_id;
    std::shared_ptr<EventSink> events;
    CancelToken cancel;

    bool cancelled() const { return cancel && cancel->load(); }
};

using ToolFunction = std::function<std::string(const ToolContext&, const nlohmann::json&)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json parameters;
    ToolFunction func;
    std::chrono::milliseconds timeout{std::chrono::seconds(120)};
    bool is_code_tool = false;
    ToolPolicy policy = ToolPolicy::single_shot;
};

class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        tools_[def.name] = std::move(def);
        spec_dirty_ = true;
    }

    bool has(const std::string& name) const {
        return tools_.count(name) > 0;
    }

    const ToolDef* find(const std::string& name) const {
        auto it = tools_.find(name);
        return it == tools_.end() ? nullptr : &it->second;
    }

    // Unknown tools fall back to single-shot.
    ToolPolicy policy_of(const std::string& name) const {
        auto it = tools_.find(name);
        return it == tools_.end() ? ToolPolicy::single_shot : it->second.policy;
    }

    std::chrono::milliseconds timeout_for(const std::string& name) const {
        auto it = tools_.find(name);
        return it == tools_.end() ? default_timeout_ : it->second.timeout;
    }

    bool is_code_tool(const std::string& name) const {
        auto it = tools_.find(name);
        return it != tools_.end() && it->second.is_code_tool;
    }

    void set_default_timeout(std::chrono::milliseconds t) { default_timeout_ = t; }

    nlohmann::json tools_spec() const {
        if (!spec_dirty_) return cached_spec_;
        nlohmann::json arr = nlohmann::json::array();
        for (auto& [name, def] : tools_) {
            arr.push_back({
                {"type", "function"},
                {"function", {
                    {"name", def.name},
                    {"description", def.description},
                    {"parameters", def.parameters}
                }}
            });
        }
        cached_spec_ = std::move(arr);
        spec_dirty_ = false;
        return cached_spec_;
    }

    std::vector<std::string> tool_names() const {
        std::vector<std::string> names;
        for (auto& [n, _] : tools_) names.push_back(n);
        return names;
    }

private:
    std::map<std::string, ToolDef> tools_;
    std::chrono::milliseconds default_timeout_{std::chrono::seconds(120)};
    mutable nlohmann::json cached_spec_;
    mutable bool spec_dirty_ = true;
};

} // namespace evoloop
