#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace evoloop {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
    std::vector<std::string> models;  // provider's own model ids (empty = not checked)
};

struct ContextConfig {
    int default_cap = 8192;            // soft token cap for ordinary providers
    int low_throughput_cap = 4096;     // soft cap for low-TPM providers and evolution tasks
    std::vector<std::string> low_throughput_prefixes = {"groq/", "google/"};

    size_t bible_max_chars = 180000;
    size_t scratchpad_max_chars = 90000;
    size_t identity_max_chars = 80000;
    size_t knowledge_index_max_chars = 50000;
    size_t state_max_chars = 90000;
    int identity_stale_hours = 8;
};

struct BudgetConfig {
    double total_usd = 0.0;            // 0 = take the task ceiling only
    double force_fraction = 0.5;       // > this share of remaining → forced final answer
    double warn_fraction = 0.3;        // > this share → advisory message
    int warn_every_rounds = 10;
    int self_check_every_rounds = 50;
};

struct RoutingConfig {
    std::string default_provider = "openrouter";
    std::map<std::string, ProviderConfig> providers;
    std::map<std::string, std::string> native_models;  // providerless id → provider key
    std::string free_tier_model;
    bool paid_tier = false;
    std::vector<std::string> whitelist;  // extra permitted model ids beyond pricing
};

struct PricingConfig {
    bool refresh = true;
    std::string source_base = "https://openrouter.ai";
    int ttl_sec = 0;                 // 0 = at most once per process
    size_t min_live_entries = 5;
};

struct Config {
    std::string model = "anthropic/claude-sonnet-4.6";
    std::vector<std::string> fallback_models;
    std::string workspace = "~/.evoloop";
    std::string repo_dir;            // empty = current directory
    int max_rounds = 200;
    int max_retries = 3;
    int max_tokens = 16384;
    int request_timeout_sec = 300;
    int tool_error_ceiling = 25;
    int backoff_base_ms = 1000;
    int backoff_max_ms = 30000;

    ContextConfig context;
    BudgetConfig budget;
    RoutingConfig routing;
    PricingConfig pricing;

    std::string drive_root() const { return expand_path(workspace) + "/drive"; }
    std::string repo_path() const {
        return repo_dir.empty() ? fs::current_path().string() : expand_path(repo_dir);
    }
    std::string logs_dir() const { return drive_root() + "/logs"; }

    // Environment overrides (EVOLOOP_MODEL, EVOLOOP_MODEL_FALLBACK_LIST, ...).
    void apply_env();

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

std::vector<std::string> parse_model_list(const std::string& csv);

} // namespace evoloop
