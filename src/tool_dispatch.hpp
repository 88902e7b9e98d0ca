#pragma once
#include "executor.hpp"
#include "message.hpp"
#include "tool_registry.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace evoloop {

struct ToolResult {
    std::string tool_call_id;
    std::string tool_name;
    std::string content;
    bool is_error = false;
    nlohmann::json args_for_log = nlohmann::json::object();
    bool timed_out = false;
};

struct ParsedArgs {
    bool ok = true;
    nlohmann::json args = nlohmann::json::object();
    std::string error;
};

// Recovers an argument object from what the model sent: empty → {}, a JSON
// string holding JSON is unwrapped, trailing commas are repaired.
ParsedArgs parse_tool_arguments(const std::string& raw);

// Caps a tool result at max_chars with a marker naming the original size.
std::string truncate_tool_result(const std::string& text, size_t max_chars = 15000);

Message result_to_message(const ToolResult& r);

struct DispatchLimits {
    size_t max_result_chars = 15000;
    size_t max_parallel = 8;
};

// Runs one round's tool calls. Results always come back in call order.
// Owns the sticky lane for stateful tools, so it lives for one task.
class ToolDispatcher {
public:
    ToolDispatcher(const ToolRegistry& registry, ToolContext base_ctx,
                   std::shared_ptr<EventSink> audit_log,
                   DispatchLimits limits = {});
    ~ToolDispatcher();

    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    std::vector<ToolResult> dispatch(const std::vector<ToolCall>& calls);

    bool can_parallel(const std::vector<ToolCall>& calls) const;

    // Abandoned (timed-out) jobs still running.
    size_t outstanding_tasks() { return tracker_.outstanding(); }
    bool drain(std::chrono::milliseconds timeout) { return tracker_.wait_idle(timeout); }

    const StickyLane& sticky_lane() const { return sticky_; }

private:
    const ToolRegistry& registry_;
    ToolContext base_ctx_;
    std::shared_ptr<EventSink> audit_;
    DispatchLimits limits_;
    TaskTracker tracker_;
    StickyLane sticky_;

    ToolResult execute_one(const ToolCall& tc);
    ToolResult timeout_result(const ToolCall& tc, const nlohmann::json& args_for_log,
                              std::chrono::milliseconds timeout, bool lane_reset);
    void emit_event(const nlohmann::json& event);
    void audit(const std::string& tool, const nlohmann::json& args_for_log, const std::string& result);
};

} // namespace evoloop
