#include "agent.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

namespace evoloop {

const char* round_state_name(RoundState s) {
    switch (s) {
    case RoundState::building_context:    return "building_context";
    case RoundState::calling_model:       return "calling_model";
    case RoundState::handling_tools:      return "handling_tools";
    case RoundState::final_response:      return "final_response";
    case RoundState::retry_with_fallback: return "retry_with_fallback";
    case RoundState::terminated:          return "terminated";
    }
    return "unknown";
}

static std::string usd(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << v;
    return ss.str();
}

// ── Budget and self-check ────────────────────────────────────────────

BudgetAction budget_action(const BudgetState& budget, int round, const BudgetConfig& cfg) {
    if (budget.ceiling <= 0.0) return BudgetAction::force_final;
    double pct = budget.spent / budget.ceiling;
    if (pct > cfg.force_fraction) return BudgetAction::force_final;
    if (pct > cfg.warn_fraction && cfg.warn_every_rounds > 0 && round % cfg.warn_every_rounds == 0)
        return BudgetAction::advise;
    return BudgetAction::none;
}

static std::string budget_limit_message(const BudgetState& b) {
    return "[BUDGET LIMIT] Task spent $" + usd(b.spent) + " (>50% of remaining $" + usd(b.ceiling) +
           "). Budget exhausted. Give your final response now.";
}

static std::string budget_info_message(const BudgetState& b) {
    return "[INFO] Task spent $" + usd(b.spent) + " of $" + usd(b.ceiling) + ". Wrap up if possible.";
}

std::string self_check_message(int round, int max_rounds, int context_tokens,
                               double spent, int every_rounds) {
    if (every_rounds <= 0 || round <= 1 || round % every_rounds != 0) return "";
    std::ostringstream out;
    out << "[CHECKPOINT " << (round / every_rounds) << " - round " << round << "/" << max_rounds << "]\n"
        << "Context: ~" << context_tokens << " tokens. Spent: $" << usd(spent)
        << ". Rounds remaining: " << (max_rounds - round) << ".\n"
        << "Pause and reflect: Am I making progress toward the goal? "
        << "Am I repeating an approach that keeps failing? "
        << "Should I change strategy or give my final answer now?";
    return out.str();
}

// ── Agent ────────────────────────────────────────────────────────────

Agent::Agent(const Config& config, const ToolRegistry& tools, ChatClient& client,
             PricingCache& pricing, const ContextBuilder& context, AgentLogs logs)
    : config_(config)
    , tools_(tools)
    , client_(client)
    , pricing_(pricing)
    , context_(context)
    , logs_(std::move(logs))
{
    if (!logs_.events) logs_.events = std::make_shared<MemoryEventSink>();
}

void Agent::emit(const std::shared_ptr<EventSink>& sink, const nlohmann::json& rec) {
    if (!sink) return;
    try {
        sink->emit(rec);
    } catch (const std::exception& e) {
        std::cerr << "[agent] Failed to write log record: " << e.what() << "\n";
    }
}

RunOutcome Agent::finish(RunOutcome outcome, const Task& task) {
    state_ = RoundState::terminated;
    nlohmann::json ev = {
        {"type", "task_done"},
        {"task_id", task.id},
        {"task_type", task.type},
        {"reason", termination_name(outcome.reason)},
        {"rounds", outcome.rounds},
        {"model", outcome.model},
        {"cost", outcome.usage.cost},
        {"prompt_tokens", outcome.usage.prompt_tokens},
        {"completion_tokens", outcome.usage.completion_tokens}
    };
    if (!outcome.error.empty()) ev["error"] = truncate_for_log(outcome.error, 500);
    emit(logs_.events, ev);

    std::cerr << "[agent] Task " << task.id << " finished: " << termination_name(outcome.reason)
              << " after " << outcome.rounds << " round(s), $" << usd(outcome.usage.cost) << "\n";
    return outcome;
}

static void add_note(RunOutcome& outcome, const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) return;
    outcome.assistant_notes.push_back(t.size() > 320 ? t.substr(0, 320) : t);
}

RunOutcome Agent::run(const Task& task) {
    RunOutcome outcome;
    state_ = RoundState::building_context;

    std::optional<double> ceiling = task.budget_usd;
    if (!ceiling && config_.budget.total_usd > 0.0) ceiling = config_.budget.total_usd;
    UsageAccountant usage(pricing_, *logs_.events, task.id, ceiling.value_or(0.0));

    ToolContext base_ctx;
    base_ctx.repo_dir = config_.repo_path();
    base_ctx.drive_root = config_.drive_root();
    base_ctx.task_id = task.id;
    base_ctx.events = logs_.events;
    ToolDispatcher dispatcher(tools_, base_ctx, logs_.tools);

    RetryPolicy policy{config_.max_retries, config_.backoff_base_ms, config_.backoff_max_ms};
    FallbackCaller caller(client_, FallbackChain(config_.fallback_models), policy, sleeper_);
    caller.set_on_fallback([&](const std::string& from, const std::string& to, ProviderErrorKind kind) {
        state_ = RoundState::retry_with_fallback;
        emit(logs_.events, {{"type", "model_fallback"}, {"task_id", task.id},
                            {"from", from}, {"to", to}, {"kind", error_kind_name(kind)}});
    });

    std::string active_model = config_.model;
    std::string effort = normalize_reasoning_effort(task.reasoning_effort);
    auto tools_spec = tools_.tools_spec();

    BuiltContext built = context_.build(task, active_model);
    std::vector<Message> history = std::move(built.messages);

    auto sync_outcome = [&]() {
        outcome.usage = usage.totals();
        outcome.model = active_model;
    };

    int tool_errors = 0;
    int round = 0;

    for (;;) {
        state_ = RoundState::building_context;
        round++;
        outcome.rounds = round;

        if (round > config_.max_rounds) {
            sync_outcome();
            outcome.rounds = config_.max_rounds;
            outcome.reason = Termination::round_limit;
            outcome.text = "Task exceeded the maximum of " + std::to_string(config_.max_rounds) +
                           " rounds without a final response. Consider splitting it into smaller tasks.";
            outcome.error = outcome.text;
            return finish(std::move(outcome), task);
        }

        // Rebuild the system message so runtime and budget lines are fresh.
        history.front() = context_.build_system(task);
        int cap = context_.soft_cap_for(active_model, task.type);
        CapReport cap_report;
        history = apply_soft_cap(history, cap, &cap_report);
        outcome.last_cap = cap_report;
        if (cap_report.dropped_messages > 0) {
            std::cerr << "[agent] Round " << round << ": dropped " << cap_report.dropped_messages
                      << " message(s) to fit " << cap << " tokens\n";
        }

        state_ = RoundState::calling_model;
        ChatRequest req;
        req.model = active_model;
        req.messages = history;
        req.tools_spec = tools_spec;
        req.max_tokens = config_.max_tokens;
        req.reasoning_effort = effort;

        CallResult result;
        auto started = std::chrono::steady_clock::now();
        try {
            result = caller.call(req);
        } catch (const std::exception& e) {
            sync_outcome();
            outcome.reason = Termination::fatal_error;
            outcome.error = e.what();
            outcome.text = "Model call failed on round " + std::to_string(round) + " (" +
                           error_kind_name(classify_exception(std::current_exception())) +
                           "), no fallback model left: " + std::string(e.what());
            return finish(std::move(outcome), task);
        }
        result.response.usage.elapsed_sec =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

        active_model = result.model;
        auto rec = usage.record(active_model, result.response.usage, task.type);

        const auto& resp = result.response;
        emit(logs_.rounds, {
            {"task_id", task.id},
            {"round", round},
            {"model", active_model},
            {"attempts", result.attempts},
            {"tool_calls", resp.tool_calls.size()},
            {"prompt_tokens", rec.prompt_tokens},
            {"completion_tokens", rec.completion_tokens},
            {"cached_tokens", rec.cached_tokens},
            {"cost", rec.cost},
            {"spent", usage.spent()},
            {"cap", cap_report.requested_cap},
            {"context_tokens", cap_report.actual_tokens},
            {"dropped_messages", cap_report.dropped_messages}
        });

        if (!resp.has_tool_calls()) {
            state_ = RoundState::final_response;
            sync_outcome();
            outcome.reason = Termination::success;
            outcome.text = resp.content;
            add_note(outcome, resp.content);
            return finish(std::move(outcome), task);
        }

        state_ = RoundState::handling_tools;
        Message assistant;
        assistant.role = "assistant";
        assistant.content = resp.content;
        assistant.tool_calls = resp.tool_calls;
        history.push_back(std::move(assistant));
        add_note(outcome, resp.content);

        auto results = dispatcher.dispatch(resp.tool_calls);
        for (auto& r : results) {
            if (r.is_error) tool_errors++;
            history.push_back(result_to_message(r));
        }

        if (config_.tool_error_ceiling > 0 && tool_errors >= config_.tool_error_ceiling) {
            sync_outcome();
            outcome.reason = Termination::fatal_error;
            outcome.text = "Aborted after " + std::to_string(tool_errors) +
                           " tool errors (limit " + std::to_string(config_.tool_error_ceiling) + ").";
            outcome.error = outcome.text;
            return finish(std::move(outcome), task);
        }

        auto budget = usage.budget();
        auto action = ceiling ? budget_action(budget, round, config_.budget) : BudgetAction::none;
        if (action == BudgetAction::force_final) {
            std::cerr << "[agent] Budget limit reached: $" << usd(budget.spent)
                      << " of $" << usd(budget.ceiling) << "\n";
            history.push_back(Message::text("system", budget_limit_message(budget)));

            state_ = RoundState::calling_model;
            ChatRequest final_req;
            final_req.model = active_model;
            final_req.messages = apply_soft_cap(history, context_.soft_cap_for(active_model, task.type));
            final_req.max_tokens = config_.max_tokens;
            final_req.reasoning_effort = effort;

            outcome.reason = Termination::budget_exhausted;
            try {
                auto fin = caller.call(final_req);
                active_model = fin.model;
                usage.record(active_model, fin.response.usage, task.type);
                outcome.text = fin.response.content;
                add_note(outcome, fin.response.content);
            } catch (const std::exception& e) {
                outcome.error = e.what();
                outcome.text = "Task stopped: budget exhausted ($" + usd(usage.spent()) +
                               " spent of $" + usd(budget.ceiling) + ").";
            }
            sync_outcome();
            return finish(std::move(outcome), task);
        }
        if (action == BudgetAction::advise) {
            history.push_back(Message::text("system", budget_info_message(budget)));
        }

        std::string check = self_check_message(round, config_.max_rounds, estimate_tokens(history),
                                               usage.spent(), config_.budget.self_check_every_rounds);
        if (!check.empty()) history.push_back(Message::text("system", check));
    }
}

} // namespace evoloop
