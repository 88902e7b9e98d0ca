#pragma once
#include "config.hpp"
#include "pricing.hpp"
#include "provider.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace evoloop {

struct Endpoint {
    std::string provider;     // key into routing.providers
    std::string api_base;
    std::string api_key;
    std::string wire_model;   // id as sent to the provider
};

struct Validation {
    bool ok = true;
    std::string reason;
};

// Raised before any network traffic when a model id is not eligible.
class ModelValidationError : public std::runtime_error {
public:
    ModelValidationError(const std::string& model, const std::string& reason)
        : std::runtime_error("Model '" + model + "' rejected: " + reason), model_(model) {}
    const std::string& model() const { return model_; }

private:
    std::string model_;
};

class ProviderRouter {
public:
    ProviderRouter(const RoutingConfig& cfg, PricingCache& pricing);

    Endpoint resolve(const std::string& model) const;
    Validation validate(const std::string& model) const;

    // Extra permitted ids, e.g. the free-model-ids knowledge entry.
    void add_whitelist(const std::vector<std::string>& ids);
    bool is_native(const std::string& model) const;

private:
    RoutingConfig cfg_;
    PricingCache& pricing_;
    std::set<std::string> whitelist_;

    // Provider named by the "<provider>/" prefix, if configured.
    std::optional<std::string> prefix_provider(const std::string& model) const;
};

// Ordered model ids tried after the primary fails.
class FallbackChain {
public:
    FallbackChain() = default;
    explicit FallbackChain(std::vector<std::string> models) : models_(std::move(models)) {}

    // Entry after `current`; the first entry when `current` is absent;
    // nullopt at the end or on an empty chain.
    std::optional<std::string> next_fallback(const std::string& current) const;

    const std::vector<std::string>& models() const { return models_; }
    size_t size() const { return models_.size(); }
    bool empty() const { return models_.empty(); }

private:
    std::vector<std::string> models_;
};

using ClientFactory = std::function<std::unique_ptr<ChatClient>(const Endpoint&)>;

// Validates, resolves and forwards to one cached client per provider.
class RoutedClient : public ChatClient {
public:
    RoutedClient(const ProviderRouter& router, int timeout_sec, ClientFactory factory = nullptr);

    ProviderResponse chat(const ChatRequest& req) override;

private:
    const ProviderRouter& router_;
    int timeout_sec_;
    ClientFactory factory_;
    std::mutex mu_;
    std::map<std::string, std::unique_ptr<ChatClient>> clients_;

    ChatClient& client_for(const Endpoint& ep);
};

} // namespace evoloop
