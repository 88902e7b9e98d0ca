#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace evoloop {

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON text as emitted by the model
};

// Cache lifetime hint for a system-message segment.
enum class CacheHint {
    none,
    static_layer,   // long-lived, cached for an hour
    semi_stable,    // cached for the provider's default ephemeral window
    dynamic         // never cached
};

struct ContentBlock {
    enum class Kind { text, image };

    Kind kind = Kind::text;
    std::string text;
    std::string image_base64;
    std::string mime_type = "image/png";
    CacheHint cache = CacheHint::none;

    static ContentBlock make_text(std::string t, CacheHint hint = CacheHint::none) {
        ContentBlock b;
        b.kind = Kind::text;
        b.text = std::move(t);
        b.cache = hint;
        return b;
    }

    static ContentBlock make_image(std::string base64, std::string mime) {
        ContentBlock b;
        b.kind = Kind::image;
        b.image_base64 = std::move(base64);
        b.mime_type = std::move(mime);
        return b;
    }

    nlohmann::json to_json() const {
        if (kind == Kind::image) {
            return {
                {"type", "image_url"},
                {"image_url", {{"url", "data:" + mime_type + ";base64," + image_base64}}}
            };
        }
        nlohmann::json j = {{"type", "text"}, {"text", text}};
        if (cache == CacheHint::static_layer) {
            j["cache_control"] = {{"type", "ephemeral"}, {"ttl", "1h"}};
        } else if (cache == CacheHint::semi_stable) {
            j["cache_control"] = {{"type", "ephemeral"}};
        }
        return j;
    }
};

struct Message {
    std::string role;       // "system", "user", "assistant", "tool"
    std::string content;    // plain text form
    std::vector<ContentBlock> blocks; // structured form, used when non-empty
    std::string tool_call_id;         // for role="tool"
    std::vector<ToolCall> tool_calls; // for role="assistant" with tool calls

    static Message text(std::string role, std::string content) {
        Message m;
        m.role = std::move(role);
        m.content = std::move(content);
        return m;
    }

    bool has_blocks() const { return !blocks.empty(); }

    // All text carried by the message, blocks concatenated.
    std::string text_content() const {
        if (blocks.empty()) return content;
        std::string out;
        for (auto& b : blocks) {
            if (b.kind != ContentBlock::Kind::text) continue;
            if (!out.empty()) out += "\n\n";
            out += b.text;
        }
        return out;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role;
        if (!blocks.empty()) {
            auto& arr = j["content"];
            arr = nlohmann::json::array();
            for (auto& b : blocks) arr.push_back(b.to_json());
        } else if (!content.empty() || tool_calls.empty()) {
            j["content"] = content;
        }
        if (!tool_call_id.empty()) j["tool_call_id"] = tool_call_id;
        if (!tool_calls.empty()) {
            auto& arr = j["tool_calls"];
            for (auto& tc : tool_calls) {
                arr.push_back({
                    {"id", tc.id},
                    {"type", "function"},
                    {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
                });
            }
        }
        return j;
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = j.value("role", "");
        if (j.contains("content")) {
            auto& c = j["content"];
            if (c.is_string()) {
                m.content = c.get<std::string>();
            } else if (c.is_array()) {
                for (auto& part : c) {
                    std::string type = part.value("type", "");
                    if (type == "text") {
                        m.blocks.push_back(ContentBlock::make_text(part.value("text", "")));
                    } else if (type == "image_url" && part.contains("image_url")) {
                        std::string url = part["image_url"].value("url", "");
                        std::string mime = "image/png";
                        auto comma = url.find(',');
                        auto semi = url.find(';');
                        if (url.rfind("data:", 0) == 0 && semi != std::string::npos) {
                            mime = url.substr(5, semi - 5);
                        }
                        m.blocks.push_back(ContentBlock::make_image(
                            comma != std::string::npos ? url.substr(comma + 1) : url, mime));
                    }
                }
            }
        }
        m.tool_call_id = j.value("tool_call_id", "");
        if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
            for (auto& tc : j["tool_calls"]) {
                ToolCall t;
                t.id = tc.value("id", "");
                if (tc.contains("function")) {
                    t.name = tc["function"].value("name", "");
                    auto& args = tc["function"]["arguments"];
                    if (args.is_string()) t.arguments = args.get<std::string>();
                    else if (!args.is_null()) t.arguments = args.dump();
                }
                m.tool_calls.push_back(std::move(t));
            }
        }
        return m;
    }
};

// ── Token estimation (4 chars ≈ 1 token, conservative) ──────────────
inline int estimate_tokens(const std::string& text) {
    return static_cast<int>((text.size() + 3) / 4);
}

inline int estimate_tokens(const Message& msg) {
    int tokens = estimate_tokens(msg.text_content()) + 4; // role overhead
    for (auto& tc : msg.tool_calls) {
        tokens += estimate_tokens(tc.name) + estimate_tokens(tc.arguments) + 8;
    }
    return tokens;
}

inline int estimate_tokens(const std::vector<Message>& msgs) {
    int total = 0;
    for (auto& m : msgs) total += estimate_tokens(m);
    return total;
}

} // namespace evoloop
