#include "provider_chain.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace evoloop {

const char* error_kind_name(ProviderErrorKind kind) {
    switch (kind) {
    case ProviderErrorKind::rate_limit:       return "rate_limit";
    case ProviderErrorKind::timeout:          return "timeout";
    case ProviderErrorKind::overloaded:       return "overloaded";
    case ProviderErrorKind::context_overflow: return "context_overflow";
    case ProviderErrorKind::auth:             return "auth";
    case ProviderErrorKind::billing:          return "billing";
    case ProviderErrorKind::invalid_model:    return "invalid_model";
    case ProviderErrorKind::empty_response:   return "empty_response";
    default:                                  return "unknown";
    }
}

// ── Error classification ─────────────────────────────────────────────

static bool text_contains_any(const std::string& text, std::initializer_list<const char*> patterns) {
    for (auto p : patterns) {
        if (text.find(p) != std::string::npos) return true;
    }
    return false;
}

ProviderErrorKind classify_provider_error(const std::string& error_text) {
    if (error_text.empty()) return ProviderErrorKind::unknown;

    std::string lower;
    lower.reserve(error_text.size());
    for (char c : error_text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (text_contains_any(lower, {"rate limit", "rate_limit", "too many requests", "429", "413",
                                   "quota exceeded", "resource_exhausted", "usage limit"}))
        return ProviderErrorKind::rate_limit;

    if (text_contains_any(lower, {"overloaded", "overloaded_error"}))
        return ProviderErrorKind::overloaded;

    if (text_contains_any(lower, {"context overflow", "context window", "prompt too large",
                                   "too long", "token limit", "maximum context",
                                   "exceeds the model", "input too large"}))
        return ProviderErrorKind::context_overflow;

    if (text_contains_any(lower, {"timeout", "timed out", "deadline exceeded"}))
        return ProviderErrorKind::timeout;

    if (text_contains_any(lower, {"401", "403", "unauthorized", "forbidden",
                                   "invalid api key", "invalid_api_key", "authentication"}))
        return ProviderErrorKind::auth;

    if (text_contains_any(lower, {"402", "payment required", "insufficient credits",
                                   "billing", "insufficient balance"}))
        return ProviderErrorKind::billing;

    if (lower.find("empty response") != std::string::npos)
        return ProviderErrorKind::empty_response;

    return ProviderErrorKind::unknown;
}

static ProviderErrorKind classify_status(int status) {
    switch (status) {
    case 413:
    case 429: return ProviderErrorKind::rate_limit;
    case 401:
    case 403: return ProviderErrorKind::auth;
    case 402: return ProviderErrorKind::billing;
    case 408:
    case 504: return ProviderErrorKind::timeout;
    case 503:
    case 529: return ProviderErrorKind::overloaded;
    default:  return ProviderErrorKind::unknown;
    }
}

ProviderErrorKind classify_exception(const std::exception_ptr& ep) {
    if (!ep) return ProviderErrorKind::unknown;
    try {
        std::rethrow_exception(ep);
    } catch (const ModelValidationError&) {
        return ProviderErrorKind::invalid_model;
    } catch (const ApiError& e) {
        auto kind = classify_status(e.status());
        return kind != ProviderErrorKind::unknown ? kind : classify_provider_error(e.what());
    } catch (const std::exception& e) {
        return classify_provider_error(e.what());
    }
}

// ── Retry decision ───────────────────────────────────────────────────

RetryDecision decide_retry(int attempts_made, ProviderErrorKind kind,
                           const std::string& current_model,
                           const FallbackChain& chain, const RetryPolicy& policy) {
    RetryDecision d;
    if (attempts_made >= policy.max_retries + 1) return d;

    auto next = chain.next_fallback(current_model);
    if (!next) return d;

    d.action = RetryDecision::Action::retry_fallback;
    d.next_model = *next;
    if (kind == ProviderErrorKind::rate_limit) {
        int shift = std::min(std::max(attempts_made - 1, 0), 16);
        long long delay = static_cast<long long>(policy.backoff_base_ms) << shift;
        d.backoff_ms = static_cast<int>(std::min<long long>(delay, policy.backoff_max_ms));
    }
    return d;
}

// ── FallbackCaller ───────────────────────────────────────────────────

FallbackCaller::FallbackCaller(ChatClient& client, FallbackChain chain, RetryPolicy policy,
                               Sleeper sleeper)
    : client_(client)
    , chain_(std::move(chain))
    , policy_(policy)
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

CallResult FallbackCaller::call(ChatRequest req) {
    int attempts = 0;
    for (;;) {
        attempts++;
        std::exception_ptr failure;
        try {
            auto resp = client_.chat(req);
            if (!resp.empty()) {
                return CallResult{std::move(resp), req.model, attempts};
            }
            throw std::runtime_error("Empty response from model '" + req.model + "'");
        } catch (const std::exception&) {
            failure = std::current_exception();
        }

        auto kind = classify_exception(failure);
        auto decision = decide_retry(attempts, kind, req.model, chain_, policy_);

        std::string what;
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            what = e.what();
        }

        if (decision.action == RetryDecision::Action::abort) {
            std::cerr << "[fallback] Model '" << req.model << "' failed (" << error_kind_name(kind)
                      << "): " << what << "; no fallback left after " << attempts << " attempt(s)\n";
            std::rethrow_exception(failure);
        }

        std::cerr << "[fallback] Model '" << req.model << "' failed (" << error_kind_name(kind)
                  << "): " << what << "; switching to '" << decision.next_model << "'\n";
        if (on_fallback_) on_fallback_(req.model, decision.next_model, kind);
        if (decision.backoff_ms > 0) {
            sleeper_(std::chrono::milliseconds(decision.backoff_ms));
        }
        req.model = decision.next_model;
    }
}

} // namespace evoloop
