#pragma once
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace evoloop {

// USD per million tokens.
struct ModelPrice {
    double input = 0.0;
    double cached = 0.0;
    double output = 0.0;
};

using PricingMap = std::map<std::string, ModelPrice>;
using PricingFetcher = std::function<PricingMap()>;

// Built-in table, used as the base layer under any live prices.
PricingMap default_pricing_table();

// Converts an OpenRouter /api/v1/models payload into per-million prices.
PricingMap parse_openrouter_pricing(const nlohmann::json& body);

// GET <base>/api/v1/models. Throws std::runtime_error on transport or HTTP failure.
PricingMap fetch_openrouter_pricing(const std::string& base_url, int timeout_sec = 15);

// Static table plus a lazily merged live table. The fetch runs at most once
// per process, or again once ttl_sec has elapsed when ttl_sec > 0. A failed
// fetch still counts as fetched so callers are never blocked by it.
class PricingCache {
public:
    explicit PricingCache(PricingMap static_table,
                          PricingFetcher fetcher = nullptr,
                          EpochClock clock = nullptr,
                          int ttl_sec = 0,
                          size_t min_live_entries = 5);

    PricingMap table();
    std::optional<ModelPrice> lookup(const std::string& model);

    // Exact key, else longest matching prefix, else 0. Rounded to 6 decimals.
    double estimate_cost(const std::string& model,
                         int64_t prompt_tokens, int64_t completion_tokens,
                         int64_t cached_tokens = 0, int64_t cache_write_tokens = 0);

    bool fetched() const;
    int fetch_count() const;
    void invalidate();

    // Permitted-model view used by the router's validation.
    bool knows(const std::string& model);

private:
    PricingMap static_;
    PricingMap merged_;
    PricingFetcher fetcher_;
    EpochClock clock_;
    int ttl_sec_;
    size_t min_live_;

    mutable std::mutex mu_;
    bool fetched_ = false;
    int64_t fetched_at_ = 0;
    int fetch_count_ = 0;

    void ensure_fresh();
};

} // namespace evoloop
