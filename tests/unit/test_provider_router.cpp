#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "provider_router.hpp"

namespace {

using evoloop::ChatClient;
using evoloop::ChatRequest;
using evoloop::Endpoint;
using evoloop::FallbackChain;
using evoloop::PricingCache;
using evoloop::ProviderResponse;
using evoloop::ProviderRouter;
using evoloop::RoutedClient;
using evoloop::RoutingConfig;

RoutingConfig routing() {
    RoutingConfig cfg;
    cfg.default_provider = "openrouter";
    cfg.providers["openrouter"] = {"key-or", "https://openrouter.ai/api/v1", {}};
    cfg.providers["groq"] = {"key-groq", "https://api.groq.com/openai/v1", {"llama-3.3-70b"}};
    cfg.native_models["local-coder"] = "ollama";
    cfg.providers["ollama"] = {"", "http://127.0.0.1:11434/v1", {}};
    return cfg;
}

class RecordingClient : public ChatClient {
public:
    explicit RecordingClient(std::vector<std::string>* seen) : seen_(seen) {}
    ProviderResponse chat(const ChatRequest& req) override {
        seen_->push_back(req.model);
        ProviderResponse r;
        r.content = "ok";
        return r;
    }

private:
    std::vector<std::string>* seen_;
};

TEST(ProviderRouterTest, PrefixedModelGoesToItsProviderWithPrefixStripped) {
    PricingCache pricing(evoloop::default_pricing_table());
    ProviderRouter router(routing(), pricing);

    Endpoint ep = router.resolve("groq/llama-3.3-70b");
    EXPECT_EQ(ep.provider, "groq");
    EXPECT_EQ(ep.wire_model, "llama-3.3-70b");
    EXPECT_EQ(ep.api_key, "key-groq");
}

TEST(ProviderRouterTest, UnconfiguredPrefixGoesToDefaultProviderUnchanged) {
    PricingCache pricing(evoloop::default_pricing_table());
    ProviderRouter router(routing(), pricing);

    Endpoint ep = router.resolve("anthropic/claude-sonnet-4.6");
    EXPECT_EQ(ep.provider, "openrouter");
    EXPECT_EQ(ep.wire_model, "anthropic/claude-sonnet-4.6");
}

TEST(ProviderRouterTest, NativeModelWins) {
    PricingCache pricing(evoloop::default_pricing_table());
    ProviderRouter router(routing(), pricing);

    EXPECT_TRUE(router.is_native("local-coder"));
    EXPECT_EQ(router.resolve("local-coder").provider, "ollama");
    EXPECT_TRUE(router.validate("local-coder").ok);
}

TEST(ProviderRouterTest, ValidationUsesPricingTableAndWhitelist) {
    PricingCache pricing(evoloop::default_pricing_table());
    ProviderRouter router(routing(), pricing);

    EXPECT_TRUE(router.validate("anthropic/claude-sonnet-4.6").ok);
    EXPECT_FALSE(router.validate("mystery/model").ok);
    EXPECT_FALSE(router.validate("").ok);

    router.add_whitelist({"  mystery/model  ", ""});
    EXPECT_TRUE(router.validate("mystery/model").ok);
}

TEST(ProviderRouterTest, PrefixProviderMustOfferTheBareModel) {
    PricingCache pricing(evoloop::default_pricing_table());
    auto cfg = routing();
    cfg.whitelist = {"groq/llama-3.3-70b", "groq/mixtral"};
    ProviderRouter router(cfg, pricing);

    EXPECT_TRUE(router.validate("groq/llama-3.3-70b").ok);
    auto v = router.validate("groq/mixtral");
    EXPECT_FALSE(v.ok);
    EXPECT_NE(v.reason.find("groq"), std::string::npos);
}

TEST(ProviderRouterTest, FreeTierModelPassesOnlyWithoutPaidTier) {
    PricingCache pricing(evoloop::default_pricing_table());
    auto cfg = routing();
    cfg.free_tier_model = "free/model";
    cfg.paid_tier = false;
    EXPECT_TRUE(ProviderRouter(cfg, pricing).validate("free/model").ok);

    cfg.paid_tier = true;
    EXPECT_FALSE(ProviderRouter(cfg, pricing).validate("free/model").ok);
}

TEST(FallbackChainTest, NextFallbackWalksTheList) {
    FallbackChain chain({"m1", "m2", "m3"});
    EXPECT_EQ(chain.next_fallback("m1").value(), "m2");
    EXPECT_EQ(chain.next_fallback("m2").value(), "m3");
    EXPECT_FALSE(chain.next_fallback("m3").has_value());
    EXPECT_EQ(chain.next_fallback("primary").value(), "m1");
    EXPECT_FALSE(FallbackChain().next_fallback("m1").has_value());
}

TEST(RoutedClientTest, RejectsInvalidModelBeforeAnyClientIsCreated) {
    PricingCache pricing(evoloop::default_pricing_table());
    ProviderRouter router(routing(), pricing);
    int created = 0;
    std::vector<std::string> seen;
    RoutedClient client(router, 5, [&](const Endpoint&) {
        created++;
        return std::make_unique<RecordingClient>(&seen);
    });

    ChatRequest req;
    req.model = "mystery/model";
    EXPECT_THROW(client.chat(req), evoloop::ModelValidationError);
    EXPECT_EQ(created, 0);
    EXPECT_TRUE(seen.empty());
}

TEST(RoutedClientTest, ForwardsWireModelAndReusesClientPerProvider) {
    PricingCache pricing(evoloop::default_pricing_table());
    auto cfg = routing();
    cfg.whitelist = {"groq/llama-3.3-70b"};
    ProviderRouter router(cfg, pricing);
    int created = 0;
    std::vector<std::string> seen;
    RoutedClient client(router, 5, [&](const Endpoint&) {
        created++;
        return std::make_unique<RecordingClient>(&seen);
    });

    ChatRequest req;
    req.model = "groq/llama-3.3-70b";
    client.chat(req);
    client.chat(req);
    req.model = "anthropic/claude-sonnet-4.6";
    client.chat(req);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "llama-3.3-70b");
    EXPECT_EQ(seen[2], "anthropic/claude-sonnet-4.6");
    EXPECT_EQ(created, 2);
}

} // namespace
