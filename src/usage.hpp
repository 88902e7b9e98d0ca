#pragma once
#include "event_log.hpp"
#include "pricing.hpp"
#include "task.hpp"
#include <cstdint>
#include <string>

namespace evoloop {

struct UsageRecord {
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t cached_tokens = 0;
    int64_t cache_write_tokens = 0;
    double elapsed_sec = 0.0;
    double cost = 0.0;
    bool cost_measured = false;   // provider reported the cost itself
};

struct BudgetState {
    double ceiling = 0.0;
    double spent = 0.0;
    double remaining() const { return ceiling > spent ? ceiling - spent : 0.0; }
};

// Turns per-call token counts into costs and usage events. Only the
// orchestrator thread touches an accountant.
class UsageAccountant {
public:
    UsageAccountant(PricingCache& pricing, EventSink& sink,
                    std::string task_id, double ceiling);

    // Fills in cost (estimated unless the provider measured it), emits an
    // llm_usage event and adds the record to the task totals.
    UsageRecord record(const std::string& model, UsageRecord usage,
                       const std::string& category);

    const UsageTotals& totals() const { return totals_; }
    BudgetState budget() const { return BudgetState{ceiling_, totals_.cost}; }
    double spent() const { return totals_.cost; }

private:
    PricingCache& pricing_;
    EventSink& sink_;
    std::string task_id_;
    double ceiling_;
    UsageTotals totals_;
};

} // namespace evoloop
