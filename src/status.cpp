#include "status.hpp"
#include "ledger.hpp"
#include "memory.hpp"
#include "pricing.hpp"
#include <iomanip>
#include <iostream>

namespace evoloop {

int cmd_status() {
    std::string cfg_path = default_config_path();
    Config cfg = Config::load(cfg_path);

    std::cout << "=== evoloop status ===\n";
    std::cout << "Config path  : " << cfg_path << "\n";
    std::cout << "Repo         : " << cfg.repo_path() << "\n";
    std::cout << "Drive        : " << cfg.drive_root() << "\n";
    std::cout << "Model        : " << cfg.model << "\n";

    std::cout << "Fallbacks    : ";
    if (cfg.fallback_models.empty()) std::cout << "(none)";
    for (size_t i = 0; i < cfg.fallback_models.size(); i++) {
        if (i) std::cout << ", ";
        std::cout << cfg.fallback_models[i];
    }
    std::cout << "\n";

    std::cout << "Providers    : ";
    bool first = true;
    for (auto& [name, p] : cfg.routing.providers) {
        if (!first) std::cout << ", ";
        std::cout << name;
        if (!p.api_base.empty()) std::cout << " (" << p.api_base << ")";
        if (p.api_key.empty()) std::cout << " [no key]";
        first = false;
    }
    if (first) std::cout << "(none)";
    std::cout << "\n";
    std::cout << "Max rounds   : " << cfg.max_rounds << "\n";

    MemoryStore memory(cfg.drive_root());
    std::cout << "Knowledge    : " << memory.list_topics().size() << " topic(s)\n";

    try {
        Ledger ledger(cfg.drive_root() + "/state/ledger.db");
        if (cfg.budget.total_usd > 0.0) ledger.set_total_budget(cfg.budget.total_usd);
        auto snap = ledger.budget_snapshot();
        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Budget       : $" << snap.total << " total, $" << snap.spent
                  << " spent, $" << snap.remaining() << " remaining\n";

        auto recent = ledger.recent(10);
        if (!recent.empty()) {
            std::cout << "\nRecent calls:\n";
            for (auto& e : recent) {
                std::cout << "  " << utc_iso(e.ts) << "  " << std::left << std::setw(36) << e.model
                          << " " << std::right << std::setw(8) << e.prompt_tokens << " in "
                          << std::setw(7) << e.completion_tokens << " out  $" << e.cost
                          << (e.cost_estimated ? " (est)" : "") << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[status] Ledger unavailable: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int cmd_cost(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cerr << "Usage: evoloop cost MODEL PROMPT_TOKENS COMPLETION_TOKENS [CACHED_TOKENS]\n";
        return 1;
    }
    Config cfg = Config::load(default_config_path());

    int64_t prompt = 0, completion = 0, cached = 0;
    try {
        prompt = std::stoll(args[1]);
        completion = std::stoll(args[2]);
        if (args.size() > 3) cached = std::stoll(args[3]);
    } catch (const std::exception&) {
        std::cerr << "[cost] Token counts must be integers\n";
        return 1;
    }

    PricingFetcher fetcher;
    if (cfg.pricing.refresh) {
        std::string base = cfg.pricing.source_base;
        fetcher = [base]() { return fetch_openrouter_pricing(base); };
    }
    PricingCache pricing(default_pricing_table(), fetcher, nullptr,
                         cfg.pricing.ttl_sec, cfg.pricing.min_live_entries);

    const std::string& model = args[0];
    auto price = pricing.lookup(model);
    double cost = pricing.estimate_cost(model, prompt, completion, cached);

    std::cout << std::fixed << std::setprecision(6);
    if (price) {
        std::cout << "Pricing      : $" << price->input << " in / $" << price->cached
                  << " cached / $" << price->output << " out per 1M tokens\n";
    } else {
        std::cout << "Pricing      : unknown model\n";
    }
    std::cout << "Cost         : $" << cost << "\n";
    return 0;
}

} // namespace evoloop
