#pragma once
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace evoloop {

// Append-only sink for structured events (llm_usage, tool_error, tool_timeout, ...).
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const nlohmann::json& event) = 0;
};

// One JSON object per line. Adds "ts" when the record has none.
class JsonlLog : public EventSink {
public:
    explicit JsonlLog(std::string path);

    void emit(const nlohmann::json& event) override;

    std::vector<nlohmann::json> read_all() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mu_;
};

// Fans one event out to several sinks.
class TeeEventSink : public EventSink {
public:
    TeeEventSink() = default;
    explicit TeeEventSink(std::vector<std::shared_ptr<EventSink>> sinks) : sinks_(std::move(sinks)) {}

    void add(std::shared_ptr<EventSink> sink) { sinks_.push_back(std::move(sink)); }
    void emit(const nlohmann::json& event) override;

private:
    std::vector<std::shared_ptr<EventSink>> sinks_;
};

// Keeps events in memory; used by `status` summaries and tests.
class MemoryEventSink : public EventSink {
public:
    void emit(const nlohmann::json& event) override {
        std::lock_guard<std::mutex> lock(mu_);
        events_.push_back(event);
    }

    std::vector<nlohmann::json> events() const {
        std::lock_guard<std::mutex> lock(mu_);
        return events_;
    }

    std::vector<nlohmann::json> of_type(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<nlohmann::json> out;
        for (auto& e : events_) {
            if (e.value("type", "") == type) out.push_back(e);
        }
        return out;
    }

private:
    mutable std::mutex mu_;
    std::vector<nlohmann::json> events_;
};

// ── Secret redaction for logs ─────────────────────────────────────────

// Secret-looking keys are masked; long string values are cut to 500 chars.
nlohmann::json sanitize_tool_args_for_log(const nlohmann::json& args);

// Masks API tokens (sk-..., ghp_..., Bearer ...) inside free text.
std::string sanitize_tool_result_for_log(const std::string& text);

} // namespace evoloop
