#pragma once
#include "provider.hpp"
#include "provider_router.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <string>

namespace evoloop {

// ── Error classification for provider retry ─────────────────────────
enum class ProviderErrorKind {
    unknown,
    rate_limit,
    timeout,
    overloaded,
    context_overflow,
    auth,
    billing,
    invalid_model,
    empty_response
};

const char* error_kind_name(ProviderErrorKind kind);
ProviderErrorKind classify_provider_error(const std::string& error_text);
ProviderErrorKind classify_exception(const std::exception_ptr& ep);

struct RetryPolicy {
    int max_retries = 3;          // attempts = max_retries + 1 at most
    int backoff_base_ms = 1000;
    int backoff_max_ms = 30000;
};

struct RetryDecision {
    enum class Action { abort, retry_fallback };
    Action action = Action::abort;
    int backoff_ms = 0;
    std::string next_model;
};

// attempts_made counts calls already issued, including the failed one.
RetryDecision decide_retry(int attempts_made, ProviderErrorKind kind,
                           const std::string& current_model,
                           const FallbackChain& chain, const RetryPolicy& policy);

struct CallResult {
    ProviderResponse response;
    std::string model;     // model that answered
    int attempts = 0;
};

// Calls the client, swapping to the next fallback model on failure. When no
// candidate remains the underlying exception is rethrown unchanged.
class FallbackCaller {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using FallbackListener = std::function<void(const std::string& from, const std::string& to,
                                                ProviderErrorKind kind)>;

    FallbackCaller(ChatClient& client, FallbackChain chain, RetryPolicy policy,
                   Sleeper sleeper = nullptr);

    CallResult call(ChatRequest req);

    void set_on_fallback(FallbackListener l) { on_fallback_ = std::move(l); }

    const FallbackChain& chain() const { return chain_; }

private:
    ChatClient& client_;
    FallbackChain chain_;
    RetryPolicy policy_;
    Sleeper sleeper_;
    FallbackListener on_fallback_;
};

} // namespace evoloop
