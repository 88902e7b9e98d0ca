#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>
#include <vector>
#include <functional>

namespace evoloop {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.evoloop/config.json";
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

using EpochClock = std::function<int64_t()>;

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string utc_iso(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

inline std::string utc_now_iso() {
    return utc_iso(epoch_now());
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            out.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

// Clip to max_chars keeping the head, with a marker naming the original size.
inline std::string clip_text(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "\n...(clipped from " + std::to_string(text.size()) + " chars)";
}

inline std::string truncate_for_log(const std::string& text, size_t max_chars = 2000) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "...";
}

// Normalize a model-supplied relative path: strip leading slashes, reject
// any ".." component. Throws std::invalid_argument on traversal.
inline std::string safe_relpath(const std::string& p) {
    std::string s = p;
    while (!s.empty() && (s.front() == '/' || s.front() == '\\')) s.erase(0, 1);
    fs::path normalized = fs::path(s).lexically_normal();
    for (auto& part : normalized) {
        if (part == "..") {
            throw std::invalid_argument("Path traversal is not allowed: " + p);
        }
    }
    std::string out = normalized.generic_string();
    if (out == ".") return "";
    return out;
}

} // namespace evoloop
