#pragma once
#include "config.hpp"
#include "message.hpp"
#include "usage.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace evoloop {

struct ChatRequest {
    std::string model;
    std::vector<Message> messages;
    nlohmann::json tools_spec = nlohmann::json::array();   // empty = no tools offered
    int max_tokens = 16384;
    std::string reasoning_effort = "medium";
};

struct ProviderResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    UsageRecord usage;
    bool has_tool_calls() const { return !tool_calls.empty(); }
    bool empty() const { return content.empty() && tool_calls.empty(); }
};

// HTTP-level failure. status 0 means the request never got a response.
class ApiError : public std::runtime_error {
public:
    ApiError(int status, const std::string& msg)
        : std::runtime_error(msg), status_(status) {}
    int status() const { return status_; }
    bool is_rate_limit() const { return status_ == 429 || status_ == 413; }

private:
    int status_;
};

// Anything that can answer a chat request: the HTTP provider, the router, test fakes.
class ChatClient {
public:
    virtual ~ChatClient() = default;
    virtual ProviderResponse chat(const ChatRequest& req) = 0;
};

// OpenAI-compatible /chat/completions client.
class Provider : public ChatClient {
public:
    explicit Provider(const ProviderConfig& cfg, int timeout_sec = 300);

    ProviderResponse chat(const ChatRequest& req) override;

    const ProviderConfig& config() const { return config_; }

private:
    ProviderConfig config_;
    int timeout_sec_;
    // Cached URL components (parsed once in constructor)
    std::string scheme_;
    std::string host_;
    int port_;
    std::string path_prefix_;
    std::string base_url_;  // scheme://host:port
};

// Drops trailing commas before } or ] outside string literals.
std::string fix_json(const std::string& s);

// Tool calls written into plain text: <toolcall>, <tool_call> or ```json blocks.
std::vector<ToolCall> parse_text_tool_calls(const std::string& text);
std::string strip_tool_content(const std::string& text);

// Request body and response parsing, exposed for tests.
nlohmann::json build_chat_body(const ChatRequest& req);
ProviderResponse parse_chat_response(const nlohmann::json& j);

} // namespace evoloop
