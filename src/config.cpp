#include "config.hpp"
#include <fstream>
#include <iostream>

namespace evoloop {

std::vector<std::string> parse_model_list(const std::string& csv) {
    std::vector<std::string> out;
    for (auto& part : split(csv, ',')) {
        std::string m = trim(part);
        if (!m.empty()) out.push_back(m);
    }
    return out;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

Config Config::make_default() {
    Config c;
    c.routing.providers["openrouter"] = ProviderConfig{"", "https://openrouter.ai/api/v1", {}};
    return c;
}

void Config::apply_env() {
    if (const char* v = std::getenv("EVOLOOP_MODEL"); v && *v) {
        model = v;
    }
    if (const char* v = std::getenv("EVOLOOP_MODEL_FALLBACK_LIST"); v && *v) {
        fallback_models = parse_model_list(v);
    }
    if (const char* v = std::getenv("EVOLOOP_MAX_ROUNDS"); v && *v) {
        try {
            max_rounds = std::stoi(v);
        } catch (const std::exception&) {
            std::cerr << "[config] Warning: ignoring invalid EVOLOOP_MAX_ROUNDS '" << v << "'\n";
        }
    }
    if (const char* v = std::getenv("EVOLOOP_TOTAL_BUDGET"); v && *v) {
        try {
            budget.total_usd = std::stod(v);
        } catch (const std::exception&) {
            std::cerr << "[config] Warning: ignoring invalid EVOLOOP_TOTAL_BUDGET '" << v << "'\n";
        }
    }
    if (const char* v = std::getenv("EVOLOOP_PAID_TIER"); v && *v) {
        std::string s = v;
        routing.paid_tier = (s == "1" || s == "true" || s == "yes");
    }
    if (const char* v = std::getenv("OPENROUTER_API_KEY"); v && *v) {
        auto& p = routing.providers["openrouter"];
        if (p.api_base.empty()) p.api_base = "https://openrouter.ai/api/v1";
        p.api_key = v;
    }
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["model"] = model;
    j["fallback_models"] = fallback_models;
    j["workspace"] = workspace;
    if (!repo_dir.empty()) j["repo_dir"] = repo_dir;
    j["max_rounds"] = max_rounds;
    j["max_retries"] = max_retries;
    j["max_tokens"] = max_tokens;
    j["request_timeout_sec"] = request_timeout_sec;
    j["tool_error_ceiling"] = tool_error_ceiling;
    j["backoff_base_ms"] = backoff_base_ms;
    j["backoff_max_ms"] = backoff_max_ms;

    auto& cx = j["context"];
    cx["default_cap"] = context.default_cap;
    cx["low_throughput_cap"] = context.low_throughput_cap;
    cx["low_throughput_prefixes"] = context.low_throughput_prefixes;
    cx["bible_max_chars"] = context.bible_max_chars;
    cx["scratchpad_max_chars"] = context.scratchpad_max_chars;
    cx["identity_max_chars"] = context.identity_max_chars;
    cx["knowledge_index_max_chars"] = context.knowledge_index_max_chars;
    cx["state_max_chars"] = context.state_max_chars;
    cx["identity_stale_hours"] = context.identity_stale_hours;

    auto& bj = j["budget"];
    bj["total_usd"] = budget.total_usd;
    bj["force_fraction"] = budget.force_fraction;
    bj["warn_fraction"] = budget.warn_fraction;
    bj["warn_every_rounds"] = budget.warn_every_rounds;
    bj["self_check_every_rounds"] = budget.self_check_every_rounds;

    auto& rj = j["routing"];
    rj["default_provider"] = routing.default_provider;
    for (auto& [k, v] : routing.providers) {
        rj["providers"][k] = {{"api_base", v.api_base}};
        if (!v.api_key.empty()) rj["providers"][k]["api_key"] = v.api_key;
        if (!v.models.empty()) rj["providers"][k]["models"] = v.models;
    }
    if (!routing.native_models.empty()) rj["native_models"] = routing.native_models;
    if (!routing.free_tier_model.empty()) rj["free_tier_model"] = routing.free_tier_model;
    rj["paid_tier"] = routing.paid_tier;
    if (!routing.whitelist.empty()) rj["whitelist"] = routing.whitelist;

    auto& pj = j["pricing"];
    pj["refresh"] = pricing.refresh;
    pj["source_base"] = pricing.source_base;
    pj["ttl_sec"] = pricing.ttl_sec;
    pj["min_live_entries"] = pricing.min_live_entries;

    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c = make_default();

    c.model = j.value("model", c.model);
    if (j.contains("fallback_models")) {
        auto& fm = j["fallback_models"];
        c.fallback_models = fm.is_string() ? parse_model_list(fm.get<std::string>())
                                           : parse_string_array(fm);
    }
    c.workspace = j.value("workspace", c.workspace);
    c.repo_dir = j.value("repo_dir", c.repo_dir);
    c.max_rounds = j.value("max_rounds", c.max_rounds);
    c.max_retries = j.value("max_retries", c.max_retries);
    c.max_tokens = j.value("max_tokens", c.max_tokens);
    c.request_timeout_sec = j.value("request_timeout_sec", c.request_timeout_sec);
    c.tool_error_ceiling = j.value("tool_error_ceiling", c.tool_error_ceiling);
    c.backoff_base_ms = j.value("backoff_base_ms", c.backoff_base_ms);
    c.backoff_max_ms = j.value("backoff_max_ms", c.backoff_max_ms);

    if (j.contains("context")) {
        auto& cx = j["context"];
        c.context.default_cap = cx.value("default_cap", c.context.default_cap);
        c.context.low_throughput_cap = cx.value("low_throughput_cap", c.context.low_throughput_cap);
        if (cx.contains("low_throughput_prefixes"))
            c.context.low_throughput_prefixes = parse_string_array(cx["low_throughput_prefixes"]);
        c.context.bible_max_chars = cx.value("bible_max_chars", c.context.bible_max_chars);
        c.context.scratchpad_max_chars = cx.value("scratchpad_max_chars", c.context.scratchpad_max_chars);
        c.context.identity_max_chars = cx.value("identity_max_chars", c.context.identity_max_chars);
        c.context.knowledge_index_max_chars =
            cx.value("knowledge_index_max_chars", c.context.knowledge_index_max_chars);
        c.context.state_max_chars = cx.value("state_max_chars", c.context.state_max_chars);
        c.context.identity_stale_hours = cx.value("identity_stale_hours", c.context.identity_stale_hours);
    }

    if (j.contains("budget")) {
        auto& bj = j["budget"];
        c.budget.total_usd = bj.value("total_usd", c.budget.total_usd);
        c.budget.force_fraction = bj.value("force_fraction", c.budget.force_fraction);
        c.budget.warn_fraction = bj.value("warn_fraction", c.budget.warn_fraction);
        c.budget.warn_every_rounds = bj.value("warn_every_rounds", c.budget.warn_every_rounds);
        c.budget.self_check_every_rounds =
            bj.value("self_check_every_rounds", c.budget.self_check_every_rounds);
    }

    if (j.contains("routing")) {
        auto& rj = j["routing"];
        c.routing.default_provider = rj.value("default_provider", c.routing.default_provider);
        if (rj.contains("providers")) {
            for (auto& [k, v] : rj["providers"].items()) {
                ProviderConfig p;
                p.api_key = v.value("api_key", "");
                p.api_base = v.value("api_base", "");
                if (v.contains("models")) p.models = parse_string_array(v["models"]);
                c.routing.providers[k] = std::move(p);
            }
        }
        if (rj.contains("native_models") && rj["native_models"].is_object()) {
            for (auto& [k, v] : rj["native_models"].items()) {
                if (v.is_string()) c.routing.native_models[k] = v.get<std::string>();
            }
        }
        c.routing.free_tier_model = rj.value("free_tier_model", c.routing.free_tier_model);
        c.routing.paid_tier = rj.value("paid_tier", c.routing.paid_tier);
        if (rj.contains("whitelist")) c.routing.whitelist = parse_string_array(rj["whitelist"]);
    }

    if (j.contains("pricing")) {
        auto& pj = j["pricing"];
        c.pricing.refresh = pj.value("refresh", c.pricing.refresh);
        c.pricing.source_base = pj.value("source_base", c.pricing.source_base);
        c.pricing.ttl_sec = pj.value("ttl_sec", c.pricing.ttl_sec);
        c.pricing.min_live_entries = pj.value("min_live_entries", c.pricing.min_live_entries);
    }

    return c;
}

Config Config::load(const std::string& path) {
    Config c;
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] Config not found at " << path << ", using defaults\n";
        c = make_default();
    } else {
        try {
            nlohmann::json j = nlohmann::json::parse(f);
            c = from_json(j);
        } catch (const std::exception& e) {
            std::cerr << "[config] Failed to parse config: " << e.what() << ", using defaults\n";
            c = make_default();
        }
    }
    c.apply_env();
    return c;
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace evoloop
