#include "provider_router.hpp"
#include <algorithm>
#include <iostream>

namespace evoloop {

ProviderRouter::ProviderRouter(const RoutingConfig& cfg, PricingCache& pricing)
    : cfg_(cfg), pricing_(pricing)
{
    for (auto& id : cfg_.whitelist) whitelist_.insert(id);
}

void ProviderRouter::add_whitelist(const std::vector<std::string>& ids) {
    for (auto& id : ids) {
        std::string t = trim(id);
        if (!t.empty()) whitelist_.insert(t);
    }
}

bool ProviderRouter::is_native(const std::string& model) const {
    return cfg_.native_models.count(model) > 0;
}

std::optional<std::string> ProviderRouter::prefix_provider(const std::string& model) const {
    auto slash = model.find('/');
    if (slash == std::string::npos || slash == 0) return std::nullopt;
    std::string prefix = model.substr(0, slash);
    if (prefix == cfg_.default_provider) return std::nullopt;
    if (cfg_.providers.count(prefix) == 0) return std::nullopt;
    return prefix;
}

static Endpoint endpoint_for(const RoutingConfig& cfg, const std::string& provider,
                             const std::string& wire_model) {
    Endpoint ep;
    ep.provider = provider;
    ep.wire_model = wire_model;
    auto it = cfg.providers.find(provider);
    if (it != cfg.providers.end()) {
        ep.api_base = it->second.api_base;
        ep.api_key = it->second.api_key;
    }
    return ep;
}

Endpoint ProviderRouter::resolve(const std::string& model) const {
    auto native = cfg_.native_models.find(model);
    if (native != cfg_.native_models.end()) {
        return endpoint_for(cfg_, native->second, model);
    }
    if (auto p = prefix_provider(model)) {
        return endpoint_for(cfg_, *p, model.substr(p->size() + 1));
    }
    return endpoint_for(cfg_, cfg_.default_provider, model);
}

Validation ProviderRouter::validate(const std::string& model) const {
    if (model.empty()) return {false, "empty model id"};

    if (is_native(model)) return {};
    if (!cfg_.paid_tier && !cfg_.free_tier_model.empty() && model == cfg_.free_tier_model) return {};

    if (!pricing_.knows(model) && whitelist_.count(model) == 0) {
        return {false, "not in the pricing table or model whitelist"};
    }

    if (auto p = prefix_provider(model)) {
        auto& own = cfg_.providers.at(*p).models;
        std::string bare = model.substr(p->size() + 1);
        if (!own.empty() && std::find(own.begin(), own.end(), bare) == own.end()) {
            return {false, "'" + bare + "' is not offered by provider '" + *p + "'"};
        }
    }
    return {};
}

// ── FallbackChain ────────────────────────────────────────────────────

std::optional<std::string> FallbackChain::next_fallback(const std::string& current) const {
    if (models_.empty()) return std::nullopt;
    auto it = std::find(models_.begin(), models_.end(), current);
    if (it == models_.end()) return models_.front();
    ++it;
    if (it == models_.end()) return std::nullopt;
    return *it;
}

// ── RoutedClient ─────────────────────────────────────────────────────

RoutedClient::RoutedClient(const ProviderRouter& router, int timeout_sec, ClientFactory factory)
    : router_(router), timeout_sec_(timeout_sec), factory_(std::move(factory))
{
    if (!factory_) {
        factory_ = [this](const Endpoint& ep) -> std::unique_ptr<ChatClient> {
            return std::make_unique<Provider>(ProviderConfig{ep.api_key, ep.api_base, {}}, timeout_sec_);
        };
    }
}

ChatClient& RoutedClient::client_for(const Endpoint& ep) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = clients_.find(ep.provider);
    if (it == clients_.end()) {
        if (ep.api_base.empty()) {
            throw ApiError(0, "Provider '" + ep.provider + "' has no api_base configured");
        }
        it = clients_.emplace(ep.provider, factory_(ep)).first;
    }
    return *it->second;
}

ProviderResponse RoutedClient::chat(const ChatRequest& req) {
    auto v = router_.validate(req.model);
    if (!v.ok) {
        throw ModelValidationError(req.model, v.reason);
    }
    Endpoint ep = router_.resolve(req.model);

    ChatRequest routed = req;
    routed.model = ep.wire_model;
    return client_for(ep).chat(routed);
}

} // namespace evoloop
