#include <filesystem>
#include <memory>
#include <string>
#include <unistd.h>
#include <gtest/gtest.h>
#include "event_log.hpp"

namespace {

using evoloop::JsonlLog;
using evoloop::MemoryEventSink;
using evoloop::TeeEventSink;

TEST(EventLogTest, JsonlLogAppendsWithTimestamp) {
    auto dir = std::filesystem::temp_directory_path() /
               ("evoloop_events_" + std::to_string(::getpid()));
    std::string path = (dir / "logs" / "events.jsonl").string();
    {
        JsonlLog log(path);
        log.emit({{"type", "tool_error"}, {"tool", "repo_read"}});
        log.emit({{"type", "llm_usage"}, {"ts", "fixed"}});

        auto all = log.read_all();
        ASSERT_EQ(all.size(), 2u);
        EXPECT_EQ(all[0]["tool"], "repo_read");
        EXPECT_TRUE(all[0].contains("ts"));
        EXPECT_EQ(all[1]["ts"], "fixed");
    }
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(EventLogTest, TeeFansOutToEverySink) {
    auto a = std::make_shared<MemoryEventSink>();
    auto b = std::make_shared<MemoryEventSink>();
    TeeEventSink tee({a});
    tee.add(b);
    tee.emit({{"type", "llm_usage"}});
    tee.emit({{"type", "tool_timeout"}});

    EXPECT_EQ(a->events().size(), 2u);
    EXPECT_EQ(b->of_type("tool_timeout").size(), 1u);
}

TEST(EventLogTest, SecretArgumentsAreMasked) {
    auto args = nlohmann::json{
        {"path", "notes.md"},
        {"api_key", "sk-abcdefghijkl"},
        {"nested", {{"GitHub_Token", "ghp_123"}}},
        {"content", std::string(600, 'x')}
    };
    auto clean = evoloop::sanitize_tool_args_for_log(args);
    EXPECT_EQ(clean["path"], "notes.md");
    EXPECT_EQ(clean["api_key"], "***");
    EXPECT_EQ(clean["nested"]["GitHub_Token"], "***");
    EXPECT_LT(clean["content"].get<std::string>().size(), 600u);
}

TEST(EventLogTest, TokensInResultsAreMasked) {
    std::string text = "key=sk-abcdefghijkl auth: Bearer eyJhbGciOiJI short sk-abc";
    std::string clean = evoloop::sanitize_tool_result_for_log(text);
    EXPECT_EQ(clean.find("abcdefghijkl"), std::string::npos);
    EXPECT_EQ(clean.find("eyJhbGciOiJI"), std::string::npos);
    EXPECT_NE(clean.find("sk-abc"), std::string::npos);
}

} // namespace
