#include "usage.hpp"
#include "utils.hpp"

namespace evoloop {

UsageAccountant::UsageAccountant(PricingCache& pricing, EventSink& sink,
                                 std::string task_id, double ceiling)
    : pricing_(pricing)
    , sink_(sink)
    , task_id_(std::move(task_id))
    , ceiling_(ceiling)
{}

UsageRecord UsageAccountant::record(const std::string& model, UsageRecord usage,
                                    const std::string& category) {
    std::string model_id = model.empty() ? "unknown" : model;

    if (!usage.cost_measured) {
        usage.cost = pricing_.estimate_cost(model_id, usage.prompt_tokens, usage.completion_tokens,
                                            usage.cached_tokens, usage.cache_write_tokens);
    }

    totals_.prompt_tokens += usage.prompt_tokens;
    totals_.completion_tokens += usage.completion_tokens;
    totals_.cached_tokens += usage.cached_tokens;
    totals_.cache_write_tokens += usage.cache_write_tokens;
    totals_.cost += usage.cost;
    totals_.calls++;

    sink_.emit({
        {"ts", utc_now_iso()},
        {"type", "llm_usage"},
        {"task_id", task_id_},
        {"model", model_id},
        {"category", category},
        {"prompt_tokens", usage.prompt_tokens},
        {"completion_tokens", usage.completion_tokens},
        {"cached_tokens", usage.cached_tokens},
        {"cache_write_tokens", usage.cache_write_tokens},
        {"elapsed_sec", usage.elapsed_sec},
        {"cost", usage.cost},
        {"cost_estimated", !usage.cost_measured}
    });

    return usage;
}

} // namespace evoloop
