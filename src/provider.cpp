#include "provider.hpp"
#include <httplib.h>
#include <chrono>
#include <iostream>

namespace evoloop {

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 80;
    path_prefix = "";

    size_t pos = 0;
    if (url.substr(0, 8) == "https://") {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.substr(0, 7) == "http://") {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        port = std::stoi(host_port.substr(colon + 1));
    } else {
        host = host_port;
    }
}

Provider::Provider(const ProviderConfig& cfg, int timeout_sec)
    : config_(cfg), timeout_sec_(timeout_sec) {
    parse_url(config_.api_base, scheme_, host_, port_, path_prefix_);
    base_url_ = scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

// ── Hand-rolled JSON fix (no regex) ──────────────────────────────────

std::string fix_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_string = false;
    bool escape = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (escape) { out += c; escape = false; continue; }
        if (c == '\\' && in_string) { out += c; escape = true; continue; }
        if (c == '"') { in_string = !in_string; out += c; continue; }
        if (in_string) { out += c; continue; }
        if (c == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) j++;
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) continue;
        }
        out += c;
    }
    return out;
}

// ── Tool call parsing helpers (no regex) ─────────────────────────────

static bool try_parse_tool_call(const nlohmann::json& j, ToolCall& tc, int idx) {
    tc.id = "tc_" + std::to_string(idx);
    tc.name = j.value("name", "");
    if (tc.name.empty()) return false;
    if (j.contains("arguments")) {
        tc.arguments = j["arguments"].is_string() ? j["arguments"].get<std::string>() : j["arguments"].dump();
    } else if (j.contains("parameters")) {
        tc.arguments = j["parameters"].is_string() ? j["parameters"].get<std::string>() : j["parameters"].dump();
    }
    return true;
}

// Find matching closing brace for a JSON object starting at pos (s[pos] == '{')
static size_t find_json_object_end(const std::string& s, size_t pos) {
    if (pos >= s.size() || s[pos] != '{') return std::string::npos;
    int depth = 0;
    bool in_str = false;
    bool esc = false;
    for (size_t i = pos; i < s.size(); i++) {
        char c = s[i];
        if (esc) { esc = false; continue; }
        if (c == '\\' && in_str) { esc = true; continue; }
        if (c == '"') { in_str = !in_str; continue; }
        if (in_str) continue;
        if (c == '{') depth++;
        else if (c == '}') { depth--; if (depth == 0) return i; }
    }
    return std::string::npos;
}

static bool parse_object(const std::string& text, nlohmann::json& out) {
    out = nlohmann::json::parse(fix_json(text), nullptr, false);
    return !out.is_discarded() && out.is_object();
}

static std::vector<ToolCall> parse_tagged_tool_calls(const std::string& text,
                                                      const std::string& open_tag,
                                                      const std::string& close_tag,
                                                      int& idx) {
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t tag_start = text.find(open_tag, pos);
        if (tag_start == std::string::npos) break;
        size_t content_start = tag_start + open_tag.size();

        size_t tag_end = text.find(close_tag, content_start);
        if (tag_end == std::string::npos) break;

        std::string inner = text.substr(content_start, tag_end - content_start);
        size_t brace = inner.find('{');
        if (brace != std::string::npos) {
            size_t brace_end = find_json_object_end(inner, brace);
            nlohmann::json j;
            if (brace_end != std::string::npos &&
                parse_object(inner.substr(brace, brace_end - brace + 1), j)) {
                ToolCall tc;
                if (try_parse_tool_call(j, tc, idx++)) calls.push_back(std::move(tc));
            }
        }
        pos = tag_end + close_tag.size();
    }
    return calls;
}

static std::vector<ToolCall> parse_markdown_json_blocks(const std::string& text, int& idx) {
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t fence_start = text.find("```", pos);
        if (fence_start == std::string::npos) break;

        size_t line_end = text.find('\n', fence_start);
        if (line_end == std::string::npos) break;

        std::string lang = trim(text.substr(fence_start + 3, line_end - fence_start - 3));

        size_t fence_end = text.find("\n```", line_end);
        if (fence_end == std::string::npos) { pos = line_end; continue; }

        std::string block = text.substr(line_end + 1, fence_end - line_end - 1);
        pos = fence_end + 4;

        if (!lang.empty() && lang != "json" && lang != "tool") continue;

        size_t brace = block.find('{');
        if (brace == std::string::npos) continue;
        size_t brace_end = find_json_object_end(block, brace);
        if (brace_end == std::string::npos) continue;

        nlohmann::json j;
        if (!parse_object(block.substr(brace, brace_end - brace + 1), j)) continue;
        if (!j.contains("name")) continue;
        ToolCall tc;
        if (try_parse_tool_call(j, tc, idx++)) calls.push_back(std::move(tc));
    }
    return calls;
}

std::vector<ToolCall> parse_text_tool_calls(const std::string& text) {
    int idx = 0;
    auto calls = parse_tagged_tool_calls(text, "<toolcall>", "</toolcall>", idx);
    if (calls.empty()) calls = parse_tagged_tool_calls(text, "<tool_call>", "</tool_call>", idx);
    if (calls.empty()) calls = parse_markdown_json_blocks(text, idx);
    return calls;
}

std::string strip_tool_content(const std::string& text) {
    std::string result = text;
    for (auto& tags : {std::make_pair(std::string("<toolcall>"), std::string("</toolcall>")),
                       std::make_pair(std::string("<tool_call>"), std::string("</tool_call>"))}) {
        for (;;) {
            size_t s = result.find(tags.first);
            if (s == std::string::npos) break;
            size_t e = result.find(tags.second, s);
            if (e == std::string::npos) break;
            result.erase(s, e + tags.second.size() - s);
        }
    }
    while (!result.empty() && (result.back() == ' ' || result.back() == '\n'))
        result.pop_back();
    return result;
}

// ── Wire format ──────────────────────────────────────────────────────

nlohmann::json build_chat_body(const ChatRequest& req) {
    nlohmann::json body;
    body["model"] = req.model;
    body["max_tokens"] = req.max_tokens;

    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& m : req.messages) {
        msgs.push_back(m.to_json());
    }

    if (req.tools_spec.is_array() && !req.tools_spec.empty()) {
        body["tools"] = req.tools_spec;
        body["tool_choice"] = "auto";
    }
    if (!req.reasoning_effort.empty()) {
        body["reasoning"] = {{"effort", req.reasoning_effort}};
    }
    body["usage"] = {{"include", true}};
    return body;
}

static int64_t int_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) return 0;
    return j[key].get<int64_t>();
}

ProviderResponse parse_chat_response(const nlohmann::json& j) {
    ProviderResponse resp;
    auto choices = j.find("choices");
    if (choices != j.end() && choices->is_array() && !choices->empty()) {
        const auto& choice = choices->front();
        auto msg_it = choice.find("message");
        if (msg_it != choice.end() && msg_it->is_object()) {
            const auto& msg = *msg_it;
            if (msg.contains("content") && msg["content"].is_string()) {
                resp.content = msg["content"].get<std::string>();
            }

            // Standard OpenAI tool_calls format. Zero-argument calls may omit "arguments".
            if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
                for (auto& tc : msg["tool_calls"]) {
                    if (!tc.is_object()) continue;
                    ToolCall t;
                    t.id = tc.value("id", "");
                    auto fn = tc.find("function");
                    if (fn != tc.end() && fn->is_object()) {
                        t.name = fn->value("name", "");
                        auto args = fn->find("arguments");
                        if (args != fn->end()) {
                            if (args->is_string()) t.arguments = args->get<std::string>();
                            else if (!args->is_null()) t.arguments = args->dump();
                        }
                    }
                    if (!t.name.empty()) resp.tool_calls.push_back(std::move(t));
                }
            }
        }
    }

    if (j.contains("usage") && j["usage"].is_object()) {
        auto& u = j["usage"];
        resp.usage.prompt_tokens = int_field(u, "prompt_tokens");
        resp.usage.completion_tokens = int_field(u, "completion_tokens");
        if (u.contains("prompt_tokens_details") && u["prompt_tokens_details"].is_object()) {
            auto& d = u["prompt_tokens_details"];
            resp.usage.cached_tokens = int_field(d, "cached_tokens");
            resp.usage.cache_write_tokens = int_field(d, "cache_write_tokens");
        }
        if (u.contains("cost") && u["cost"].is_number()) {
            resp.usage.cost = u["cost"].get<double>();
            resp.usage.cost_measured = true;
        }
    }

    // Fallback parsing: models that write tool calls into the text
    if (resp.tool_calls.empty() && !resp.content.empty()) {
        auto fallback = parse_text_tool_calls(resp.content);
        if (!fallback.empty()) {
            resp.tool_calls = std::move(fallback);
            resp.content = strip_tool_content(resp.content);
        }
    }
    return resp;
}

ProviderResponse Provider::chat(const ChatRequest& req) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(30);
    cli.set_read_timeout(timeout_sec_);

    std::string path = path_prefix_ + "/chat/completions";
    std::string payload = build_chat_body(req).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    httplib::Headers headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    auto started = std::chrono::steady_clock::now();
    auto res = cli.Post(path, headers, payload, "application/json");
    if (!res) {
        throw ApiError(0, "Provider request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw ApiError(res->status, "Provider returned status " + std::to_string(res->status) +
                                    ": " + truncate_for_log(res->body, 500));
    }

    ProviderResponse resp;
    try {
        resp = parse_chat_response(nlohmann::json::parse(res->body));
    } catch (const nlohmann::json::exception& e) {
        throw ApiError(res->status, std::string("Failed to parse provider response: ") + e.what());
    }
    resp.usage.elapsed_sec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    return resp;
}

} // namespace evoloop
