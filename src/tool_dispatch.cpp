#include "tool_dispatch.hpp"
#include "provider.hpp"
#include "utils.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>

namespace evoloop {

// ── Argument recovery ────────────────────────────────────────────────

static bool try_parse(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        err = e.what();
        return false;
    }
}

ParsedArgs parse_tool_arguments(const std::string& raw) {
    ParsedArgs pa;
    std::string text = trim(raw);
    if (text.empty()) return pa;

    nlohmann::json j;
    std::string err;
    if (!try_parse(text, j, err)) {
        std::string ignored;
        if (!try_parse(fix_json(text), j, ignored)) {
            pa.ok = false;
            pa.error = err;
            return pa;
        }
    }

    // Some models double-encode: "{\"path\": \"x\"}"
    if (j.is_string()) {
        std::string inner = trim(j.get<std::string>());
        if (inner.empty()) return pa;
        if (!try_parse(inner, j, err) && !try_parse(fix_json(inner), j, err)) {
            pa.ok = false;
            pa.error = err;
            return pa;
        }
    }

    if (j.is_null()) return pa;
    if (!j.is_object()) {
        pa.ok = false;
        pa.error = std::string("expected a JSON object, got ") + j.type_name();
        return pa;
    }
    pa.args = std::move(j);
    return pa;
}

std::string truncate_tool_result(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "\n... (truncated from " + std::to_string(text.size()) + " chars)";
}

Message result_to_message(const ToolResult& r) {
    Message m;
    m.role = "tool";
    m.tool_call_id = r.tool_call_id;
    m.content = r.content;
    return m;
}

static std::string format_timeout(std::chrono::milliseconds t) {
    if (t.count() % 1000 == 0) return std::to_string(t.count() / 1000) + "s";
    return std::to_string(t.count()) + "ms";
}

static const std::string WARN = "\xE2\x9A\xA0\xEF\xB8\x8F";  // ⚠️

// ── ToolDispatcher ───────────────────────────────────────────────────

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry, ToolContext base_ctx,
                               std::shared_ptr<EventSink> audit_log, DispatchLimits limits)
    : registry_(registry)
    , base_ctx_(std::move(base_ctx))
    , audit_(std::move(audit_log))
    , limits_(limits)
    , sticky_(tracker_)
{}

ToolDispatcher::~ToolDispatcher() {
    tracker_.cancel_all();
    size_t left = tracker_.outstanding();
    if (left > 0) {
        std::cerr << "[tools] " << left << " abandoned tool job(s) still running at teardown\n";
    }
}

void ToolDispatcher::emit_event(const nlohmann::json& event) {
    if (base_ctx_.events) base_ctx_.events->emit(event);
}

void ToolDispatcher::audit(const std::string& tool, const nlohmann::json& args_for_log,
                           const std::string& result) {
    if (!audit_) return;
    audit_->emit({
        {"ts", utc_now_iso()},
        {"tool", tool},
        {"task_id", base_ctx_.task_id},
        {"code_tool", registry_.is_code_tool(tool)},
        {"args", args_for_log},
        {"result_preview", sanitize_tool_result_for_log(truncate_for_log(result, 2000))}
    });
}

bool ToolDispatcher::can_parallel(const std::vector<ToolCall>& calls) const {
    if (calls.size() <= 1) return false;
    for (auto& tc : calls) {
        if (!registry_.has(tc.name)) return false;
        if (registry_.policy_of(tc.name) != ToolPolicy::read_only_parallel) return false;
    }
    return true;
}

ToolResult ToolDispatcher::timeout_result(const ToolCall& tc, const nlohmann::json& args_for_log,
                                          std::chrono::milliseconds timeout, bool lane_reset) {
    ToolResult r;
    r.tool_call_id = tc.id;
    r.tool_name = tc.name;
    r.args_for_log = args_for_log;
    r.is_error = true;
    r.timed_out = true;

    std::string reset_msg = lane_reset ? "Stateful tool session has been reset. " : "";
    r.content = WARN + " TOOL_TIMEOUT (" + tc.name + "): exceeded " + format_timeout(timeout) +
                " limit. The tool is still running in background but control is returned to you. " +
                reset_msg + "Try a different approach or inform the owner" +
                (lane_reset ? "" : " about the issue") + ".";

    emit_event({
        {"ts", utc_now_iso()},
        {"type", "tool_timeout"},
        {"task_id", base_ctx_.task_id},
        {"tool", tc.name},
        {"args", args_for_log},
        {"timeout_ms", timeout.count()},
        {"lane_reset", lane_reset}
    });
    audit(tc.name, args_for_log, r.content);
    return r;
}

ToolResult ToolDispatcher::execute_one(const ToolCall& tc) {
    ToolResult r;
    r.tool_call_id = tc.id;
    r.tool_name = tc.name;

    auto parsed = parse_tool_arguments(tc.arguments);
    if (!parsed.ok) {
        r.content = WARN + " TOOL_ARG_ERROR: Could not parse arguments for '" + tc.name + "': " + parsed.error;
        r.is_error = true;
        audit(tc.name, r.args_for_log, r.content);
        return r;
    }
    r.args_for_log = sanitize_tool_args_for_log(parsed.args);

    ToolContext ctx = base_ctx_;
    ctx.cancel = make_cancel_token();

    ToolFunction func;
    if (auto def = registry_.find(tc.name)) func = def->func;
    std::string name = tc.name;
    Job job = [func, name, ctx, args = std::move(parsed.args)]() -> std::string {
        if (!func) throw std::runtime_error("Unknown tool: " + name);
        return func(ctx, args);
    };

    auto timeout = registry_.timeout_for(tc.name);
    bool stateful = registry_.policy_of(tc.name) == ToolPolicy::stateful;

    SlotOutcome out = stateful
        ? sticky_.run(std::move(job), timeout, ctx.cancel, tc.name)
        : run_in_slot(std::move(job), timeout, ctx.cancel, tracker_, tc.name);

    if (out.timed_out) {
        return timeout_result(tc, r.args_for_log, timeout, stateful);
    }

    if (out.error) {
        std::string what;
        try {
            std::rethrow_exception(out.error);
        } catch (const std::exception& e) {
            what = e.what();
        }
        r.content = WARN + " TOOL_ERROR (" + tc.name + "): " + what;
        r.is_error = true;
        emit_event({
            {"ts", utc_now_iso()},
            {"type", "tool_error"},
            {"task_id", base_ctx_.task_id},
            {"tool", tc.name},
            {"args", r.args_for_log},
            {"error", what}
        });
        std::cerr << "[tools] " << tc.name << " failed: " << what << "\n";
    } else {
        r.content = truncate_tool_result(out.result, limits_.max_result_chars);
        r.is_error = starts_with(r.content, WARN);
    }

    audit(tc.name, r.args_for_log, r.content);
    return r;
}

std::vector<ToolResult> ToolDispatcher::dispatch(const std::vector<ToolCall>& calls) {
    std::vector<ToolResult> results(calls.size());
    if (calls.empty()) return results;

    if (!can_parallel(calls)) {
        for (size_t i = 0; i < calls.size(); i++) {
            results[i] = execute_one(calls[i]);
        }
        return results;
    }

    size_t workers = std::min(calls.size(), limits_.max_parallel);
    std::atomic<size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; w++) {
        pool.emplace_back([&]() {
            for (;;) {
                size_t i = next.fetch_add(1);
                if (i >= calls.size()) break;
                results[i] = execute_one(calls[i]);
            }
        });
    }
    for (auto& t : pool) t.join();
    return results;
}

} // namespace evoloop
