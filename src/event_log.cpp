#include "event_log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace evoloop {

JsonlLog::JsonlLog(std::string path) : path_(std::move(path)) {
    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
}

void JsonlLog::emit(const nlohmann::json& event) {
    nlohmann::json rec = event;
    if (rec.is_object() && !rec.contains("ts")) rec["ts"] = utc_now_iso();

    std::lock_guard<std::mutex> lock(mu_);
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        std::cerr << "[log] Cannot append to " << path_ << "\n";
        return;
    }
    f << rec.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

std::vector<nlohmann::json> JsonlLog::read_all() const {
    std::vector<nlohmann::json> out;
    std::lock_guard<std::mutex> lock(mu_);
    std::ifstream f(path_);
    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        try {
            out.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[log] Skipping corrupt line in " << path_ << ": " << e.what() << "\n";
        }
    }
    return out;
}

void TeeEventSink::emit(const nlohmann::json& event) {
    for (auto& s : sinks_) {
        if (s) s->emit(event);
    }
}

// ── Redaction ─────────────────────────────────────────────────────────

static std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool is_secret_key(const std::string& key) {
    static const char* markers[] = {"token", "secret", "password", "api_key", "apikey",
                                    "authorization", "credential"};
    std::string k = lower_copy(key);
    for (auto m : markers) {
        if (k.find(m) != std::string::npos) return true;
    }
    return false;
}

nlohmann::json sanitize_tool_args_for_log(const nlohmann::json& args) {
    constexpr size_t MAX_STR = 500;
    if (args.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto& [k, v] : args.items()) {
            if (is_secret_key(k)) {
                out[k] = "***";
            } else {
                out[k] = sanitize_tool_args_for_log(v);
            }
        }
        return out;
    }
    if (args.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (auto& v : args) out.push_back(sanitize_tool_args_for_log(v));
        return out;
    }
    if (args.is_string()) {
        const auto& s = args.get_ref<const std::string&>();
        if (s.size() > MAX_STR) {
            return s.substr(0, MAX_STR) + "...(" + std::to_string(s.size()) + " chars)";
        }
    }
    return args;
}

static bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

// Replace every run of token characters that follows `prefix` (min 8 chars).
static void mask_after(std::string& text, const std::string& prefix) {
    size_t pos = 0;
    while ((pos = text.find(prefix, pos)) != std::string::npos) {
        size_t start = pos + prefix.size();
        size_t end = start;
        while (end < text.size() && is_token_char(text[end])) end++;
        if (end - start >= 8) {
            text.replace(start, end - start, "***");
            pos = start + 3;
        } else {
            pos = end;
        }
    }
}

std::string sanitize_tool_result_for_log(const std::string& text) {
    std::string out = text;
    mask_after(out, "sk-");
    mask_after(out, "ghp_");
    mask_after(out, "Bearer ");
    return out;
}

} // namespace evoloop
