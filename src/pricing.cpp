#include "pricing.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace evoloop {

PricingMap default_pricing_table() {
    return {
        {"anthropic/claude-opus-4.6",     {5.0, 0.5, 25.0}},
        {"anthropic/claude-opus-4",       {15.0, 1.5, 75.0}},
        {"anthropic/claude-sonnet-4",     {3.0, 0.30, 15.0}},
        {"anthropic/claude-sonnet-4.6",   {3.0, 0.30, 15.0}},
        {"anthropic/claude-sonnet-4.5",   {3.0, 0.30, 15.0}},
        {"openai/o3",                     {2.0, 0.50, 8.0}},
        {"openai/o3-pro",                 {20.0, 1.0, 80.0}},
        {"openai/o4-mini",                {1.10, 0.275, 4.40}},
        {"openai/gpt-4.1",                {2.0, 0.50, 8.0}},
        {"openai/gpt-5.2",                {1.75, 0.175, 14.0}},
        {"openai/gpt-5.2-codex",          {1.75, 0.175, 14.0}},
        {"google/gemini-2.5-pro-preview", {1.25, 0.125, 10.0}},
        {"google/gemini-3-pro-preview",   {2.0, 0.20, 12.0}},
        {"x-ai/grok-3-mini",              {0.30, 0.03, 0.50}},
        {"qwen/qwen3.5-plus-02-15",       {0.40, 0.04, 2.40}},
    };
}

// OpenRouter reports prices per token as decimal strings.
static double per_million(const nlohmann::json& v) {
    double per_token = 0.0;
    if (v.is_string()) {
        try {
            per_token = std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return -1.0;
        }
    } else if (v.is_number()) {
        per_token = v.get<double>();
    } else {
        return -1.0;
    }
    return per_token * 1000000.0;
}

PricingMap parse_openrouter_pricing(const nlohmann::json& body) {
    PricingMap out;
    if (!body.contains("data") || !body["data"].is_array()) return out;

    for (auto& model : body["data"]) {
        std::string id = model.value("id", "");
        if (id.empty() || !model.contains("pricing")) continue;
        auto& p = model["pricing"];
        if (!p.contains("prompt") || !p.contains("completion")) continue;

        double input = per_million(p["prompt"]);
        double output = per_million(p["completion"]);
        if (input < 0 || output < 0) continue;

        double cached = input;
        if (p.contains("input_cache_read")) {
            double c = per_million(p["input_cache_read"]);
            if (c >= 0) cached = c;
        }
        out[id] = ModelPrice{input, cached, output};
    }
    return out;
}

PricingMap fetch_openrouter_pricing(const std::string& base_url, int timeout_sec) {
    httplib::Client cli(base_url);
    cli.set_connection_timeout(timeout_sec);
    cli.set_read_timeout(timeout_sec);

    auto res = cli.Get("/api/v1/models");
    if (!res) {
        throw std::runtime_error("Pricing fetch failed: connection error");
    }
    if (res->status != 200) {
        throw std::runtime_error("Pricing fetch returned status " + std::to_string(res->status));
    }
    return parse_openrouter_pricing(nlohmann::json::parse(res->body));
}

// ── PricingCache ──────────────────────────────────────────────────────

PricingCache::PricingCache(PricingMap static_table, PricingFetcher fetcher,
                           EpochClock clock, int ttl_sec, size_t min_live_entries)
    : static_(std::move(static_table))
    , merged_(static_)
    , fetcher_(std::move(fetcher))
    , clock_(clock ? std::move(clock) : EpochClock(epoch_now))
    , ttl_sec_(ttl_sec)
    , min_live_(min_live_entries)
{}

void PricingCache::ensure_fresh() {
    // Caller holds mu_.
    if (fetched_) {
        if (ttl_sec_ <= 0 || clock_() - fetched_at_ < ttl_sec_) return;
    }

    fetched_ = true;
    fetched_at_ = clock_();
    if (!fetcher_) return;

    fetch_count_++;
    try {
        PricingMap live = fetcher_();
        if (live.size() > min_live_) {
            merged_ = static_;
            for (auto& [k, v] : live) merged_[k] = v;
        } else {
            std::cerr << "[pricing] Live table too small (" << live.size()
                      << " entries), keeping static prices\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[pricing] Failed to sync pricing: " << e.what() << "\n";
    }
}

PricingMap PricingCache::table() {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_fresh();
    return merged_;
}

std::optional<ModelPrice> PricingCache::lookup(const std::string& model) {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_fresh();

    auto it = merged_.find(model);
    if (it != merged_.end()) return it->second;
    if (model.empty()) return std::nullopt;

    const ModelPrice* best = nullptr;
    size_t best_len = 0;
    for (auto& [key, price] : merged_) {
        if (key.size() > best_len && starts_with(model, key)) {
            best = &price;
            best_len = key.size();
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

bool PricingCache::knows(const std::string& model) {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_fresh();
    return merged_.count(model) > 0;
}

double PricingCache::estimate_cost(const std::string& model,
                                   int64_t prompt_tokens, int64_t completion_tokens,
                                   int64_t cached_tokens, int64_t /*cache_write_tokens*/) {
    auto price = lookup(model);
    if (!price) return 0.0;

    int64_t regular_input = prompt_tokens - cached_tokens;
    if (regular_input < 0) regular_input = 0;
    double cost = regular_input * price->input / 1000000.0
                + cached_tokens * price->cached / 1000000.0
                + completion_tokens * price->output / 1000000.0;
    return std::round(cost * 1e6) / 1e6;
}

bool PricingCache::fetched() const {
    std::lock_guard<std::mutex> lock(mu_);
    return fetched_;
}

int PricingCache::fetch_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return fetch_count_;
}

void PricingCache::invalidate() {
    std::lock_guard<std::mutex> lock(mu_);
    fetched_ = false;
}

} // namespace evoloop
