#pragma once
#include "message.hpp"
#include "utils.hpp"
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace evoloop {

struct Task {
    std::string id;
    std::string type = "user";    // "user", "evolution", ...
    std::string text;
    std::string image_base64;
    std::string image_mime = "image/png";
    std::string image_caption;
    std::string reasoning_effort = "medium";
    std::optional<double> budget_usd; // per-task ceiling, unset = configured total

    bool has_image() const { return !image_base64.empty(); }
    bool is_evolution() const { return type == "evolution"; }
};

// Accepts low|medium|high|xhigh (case-insensitive), anything else → "medium".
inline std::string normalize_reasoning_effort(const std::string& value,
                                              const std::string& fallback = "medium") {
    std::string v = trim(value);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "low" || v == "medium" || v == "high" || v == "xhigh") return v;
    return fallback;
}

enum class Termination {
    success,
    budget_exhausted,
    round_limit,
    fatal_error
};

inline const char* termination_name(Termination t) {
    switch (t) {
    case Termination::success:          return "success";
    case Termination::budget_exhausted: return "budget_exhausted";
    case Termination::round_limit:      return "round_limit";
    case Termination::fatal_error:      return "fatal_error";
    }
    return "unknown";
}

struct CapReport {
    int requested_cap = 0;
    int actual_tokens = 0;
    size_t dropped_messages = 0;
};

struct UsageTotals {
    long long prompt_tokens = 0;
    long long completion_tokens = 0;
    long long cached_tokens = 0;
    long long cache_write_tokens = 0;
    double cost = 0.0;
    int calls = 0;
};

struct RunOutcome {
    Termination reason = Termination::success;
    std::string text;             // final answer, or the human-readable failure
    std::string error;            // underlying error text on fatal termination
    std::string model;            // model that produced the last response
    int rounds = 0;
    UsageTotals usage;
    CapReport last_cap;
    std::vector<std::string> assistant_notes;

    bool ok() const { return reason == Termination::success; }
};

} // namespace evoloop
