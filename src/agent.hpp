#pragma once
#include "config.hpp"
#include "context.hpp"
#include "event_log.hpp"
#include "pricing.hpp"
#include "provider.hpp"
#include "provider_chain.hpp"
#include "task.hpp"
#include "tool_dispatch.hpp"
#include "tool_registry.hpp"
#include "usage.hpp"
#include <memory>
#include <string>
#include <vector>

namespace evoloop {

enum class RoundState {
    building_context,
    calling_model,
    handling_tools,
    final_response,
    retry_with_fallback,
    terminated
};

const char* round_state_name(RoundState s);

enum class BudgetAction { none, advise, force_final };

// spent against the task ceiling: > force_fraction forces a final answer,
// > warn_fraction advises on every warn_every_rounds-th round. A ceiling of
// zero or less means nothing is left and always forces.
BudgetAction budget_action(const BudgetState& budget, int round, const BudgetConfig& cfg);

// Periodic reflective prompt, or "" when this round gets none.
std::string self_check_message(int round, int max_rounds, int context_tokens,
                               double spent, int every_rounds);

struct AgentLogs {
    std::shared_ptr<EventSink> events;   // llm_usage, tool_error, tool_timeout, task_done
    std::shared_ptr<EventSink> tools;    // per-call audit
    std::shared_ptr<EventSink> rounds;   // per-round status/usage/cap
};

// Round orchestrator: build context, call the model with fallback, run the
// requested tools, check the budget, repeat until a final answer or a limit.
class Agent {
public:
    Agent(const Config& config, const ToolRegistry& tools, ChatClient& client,
          PricingCache& pricing, const ContextBuilder& context, AgentLogs logs);

    RunOutcome run(const Task& task);

    RoundState state() const { return state_; }
    void set_sleeper(FallbackCaller::Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    Config config_;
    const ToolRegistry& tools_;
    ChatClient& client_;
    PricingCache& pricing_;
    const ContextBuilder& context_;
    AgentLogs logs_;
    FallbackCaller::Sleeper sleeper_;
    RoundState state_ = RoundState::building_context;

    void emit(const std::shared_ptr<EventSink>& sink, const nlohmann::json& rec);
    RunOutcome finish(RunOutcome outcome, const Task& task);
};

} // namespace evoloop
