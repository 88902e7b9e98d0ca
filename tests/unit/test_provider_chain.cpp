#include <chrono>
#include <map>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "provider_chain.hpp"

namespace {

using evoloop::ApiError;
using evoloop::ChatClient;
using evoloop::ChatRequest;
using evoloop::FallbackCaller;
using evoloop::FallbackChain;
using evoloop::ProviderErrorKind;
using evoloop::ProviderResponse;
using evoloop::RetryDecision;
using evoloop::RetryPolicy;

// Answers per model: a handler that returns or throws.
class ScriptedClient : public ChatClient {
public:
    using Handler = std::function<ProviderResponse(const ChatRequest&)>;

    void on(const std::string& model, Handler h) { handlers_[model] = std::move(h); }

    ProviderResponse chat(const ChatRequest& req) override {
        calls.push_back(req.model);
        auto it = handlers_.find(req.model);
        if (it == handlers_.end()) throw ApiError(500, "no handler for " + req.model);
        return it->second(req);
    }

    std::vector<std::string> calls;

private:
    std::map<std::string, Handler> handlers_;
};

ProviderResponse text(const std::string& s) {
    ProviderResponse r;
    r.content = s;
    return r;
}

TEST(ProviderErrorTest, ClassifiesCommonMessages) {
    EXPECT_EQ(evoloop::classify_provider_error("HTTP 429 Too Many Requests"), ProviderErrorKind::rate_limit);
    EXPECT_EQ(evoloop::classify_provider_error("Request timed out"), ProviderErrorKind::timeout);
    EXPECT_EQ(evoloop::classify_provider_error("overloaded_error"), ProviderErrorKind::overloaded);
    EXPECT_EQ(evoloop::classify_provider_error("maximum context length exceeded"),
              ProviderErrorKind::context_overflow);
    EXPECT_EQ(evoloop::classify_provider_error("Invalid API key"), ProviderErrorKind::auth);
    EXPECT_EQ(evoloop::classify_provider_error("insufficient credits"), ProviderErrorKind::billing);
    EXPECT_EQ(evoloop::classify_provider_error("Empty response from model 'x'"),
              ProviderErrorKind::empty_response);
    EXPECT_EQ(evoloop::classify_provider_error(""), ProviderErrorKind::unknown);
}

TEST(ProviderErrorTest, StatusTakesPrecedenceOverText) {
    auto ep = std::make_exception_ptr(ApiError(413, "payload"));
    EXPECT_EQ(evoloop::classify_exception(ep), ProviderErrorKind::rate_limit);
    auto invalid = std::make_exception_ptr(evoloop::ModelValidationError("x/y", "unknown"));
    EXPECT_EQ(evoloop::classify_exception(invalid), ProviderErrorKind::invalid_model);
}

TEST(RetryDecisionTest, AbortsWhenChainIsExhausted) {
    FallbackChain chain({"m1", "m2", "m3"});
    RetryPolicy policy;
    auto d = evoloop::decide_retry(1, ProviderErrorKind::unknown, "m3", chain, policy);
    EXPECT_EQ(d.action, RetryDecision::Action::abort);

    auto next = evoloop::decide_retry(1, ProviderErrorKind::unknown, "m2", chain, policy);
    EXPECT_EQ(next.action, RetryDecision::Action::retry_fallback);
    EXPECT_EQ(next.next_model, "m3");
    EXPECT_EQ(next.backoff_ms, 0);
}

TEST(RetryDecisionTest, RateLimitBacksOffExponentiallyUpToCap) {
    FallbackChain chain({"a", "b", "c", "d", "e", "f"});
    RetryPolicy policy{10, 1000, 3000};
    EXPECT_EQ(evoloop::decide_retry(1, ProviderErrorKind::rate_limit, "a", chain, policy).backoff_ms, 1000);
    EXPECT_EQ(evoloop::decide_retry(2, ProviderErrorKind::rate_limit, "b", chain, policy).backoff_ms, 2000);
    EXPECT_EQ(evoloop::decide_retry(3, ProviderErrorKind::rate_limit, "c", chain, policy).backoff_ms, 3000);
}

TEST(RetryDecisionTest, AttemptLimitBoundsTheChain) {
    FallbackChain chain({"a", "b", "c", "d", "e", "f"});
    RetryPolicy policy{2, 0, 0};
    EXPECT_EQ(evoloop::decide_retry(3, ProviderErrorKind::unknown, "b", chain, policy).action,
              RetryDecision::Action::abort);
}

TEST(FallbackCallerTest, StartingMidChainTriesOnlyTheTail) {
    ScriptedClient client;
    auto fail = [](const ChatRequest& r) -> ProviderResponse { throw ApiError(500, "boom " + r.model); };
    client.on("m2", fail);
    client.on("m3", fail);

    FallbackCaller caller(client, FallbackChain({"m1", "m2", "m3"}), RetryPolicy{3, 0, 0},
                          [](std::chrono::milliseconds) {});
    ChatRequest req;
    req.model = "m2";
    try {
        caller.call(req);
        FAIL() << "expected the last error to propagate";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.status(), 500);
        EXPECT_NE(std::string(e.what()).find("m3"), std::string::npos);
    }
    EXPECT_EQ(client.calls, (std::vector<std::string>{"m2", "m3"}));
}

TEST(FallbackCallerTest, NeverExceedsChainLengthPlusOne) {
    ScriptedClient client;
    FallbackChain chain({"f1", "f2", "f3"});
    FallbackCaller caller(client, chain, RetryPolicy{10, 0, 0}, [](std::chrono::milliseconds) {});

    ChatRequest req;
    req.model = "primary";
    EXPECT_THROW(caller.call(req), ApiError);
    EXPECT_EQ(client.calls.size(), chain.size() + 1);
}

TEST(FallbackCallerTest, RateLimitSleepsBeforeSwitching) {
    ScriptedClient client;
    client.on("p", [](const ChatRequest&) -> ProviderResponse { throw ApiError(429, "slow down"); });
    client.on("f1", [](const ChatRequest&) { return text("done"); });

    std::vector<long long> slept;
    FallbackCaller caller(client, FallbackChain({"f1"}), RetryPolicy{3, 250, 1000},
                          [&](std::chrono::milliseconds d) { slept.push_back(d.count()); });
    std::vector<std::string> switches;
    caller.set_on_fallback([&](const std::string& from, const std::string& to, ProviderErrorKind kind) {
        EXPECT_EQ(kind, ProviderErrorKind::rate_limit);
        switches.push_back(from + "->" + to);
    });

    ChatRequest req;
    req.model = "p";
    auto result = caller.call(req);
    EXPECT_EQ(result.model, "f1");
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(result.response.content, "done");
    EXPECT_EQ(slept, (std::vector<long long>{250}));
    EXPECT_EQ(switches, (std::vector<std::string>{"p->f1"}));
}

TEST(FallbackCallerTest, EmptyResponseTriggersFallback) {
    ScriptedClient client;
    client.on("p", [](const ChatRequest&) { return ProviderResponse{}; });
    client.on("f1", [](const ChatRequest&) { return text("ok"); });

    FallbackCaller caller(client, FallbackChain({"f1"}), RetryPolicy{}, [](std::chrono::milliseconds) {});
    ChatRequest req;
    req.model = "p";
    EXPECT_EQ(caller.call(req).model, "f1");
}

} // namespace
