#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>
#include <gtest/gtest.h>
#include "context.hpp"
#include "ledger.hpp"

namespace {

using evoloop::ContextBuilder;
using evoloop::ContextConfig;
using evoloop::MemoryStore;
using evoloop::Message;
using evoloop::Task;
using evoloop::Workspace;

class TempWorkspace {
public:
    TempWorkspace() {
        static int counter = 0;
        root_ = std::filesystem::temp_directory_path() /
                ("evoloop_ctx_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(root_ / "repo");
        std::filesystem::create_directories(root_ / "drive");
    }
    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }
    std::string repo() const { return (root_ / "repo").string(); }
    std::string drive() const { return (root_ / "drive").string(); }

private:
    std::filesystem::path root_;
};

void write_file(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path);
    out << content;
}

class FixedBudget : public evoloop::BudgetSource {
public:
    evoloop::BudgetSnapshot budget_snapshot() const override { return {1.25, 10.0}; }
};

Message sized(const std::string& role, size_t chars) {
    return Message::text(role, std::string(chars, 'x'));
}

TEST(SoftCapTest, EvolutionTaskOnLowThroughputProviderGetsLowCap) {
    TempWorkspace ws;
    MemoryStore memory(ws.drive());
    ContextBuilder builder(ContextConfig{}, Workspace{ws.repo(), ws.drive()}, memory);

    EXPECT_EQ(builder.soft_cap_for("google/gemini-x", "evolution"), 4096);
    EXPECT_EQ(builder.soft_cap_for("groq/llama", "user"), 4096);
    EXPECT_EQ(builder.soft_cap_for("anthropic/claude-sonnet-4.6", "evolution"), 4096);
    EXPECT_EQ(builder.soft_cap_for("anthropic/claude-sonnet-4.6", "user"), 8192);

    Task task;
    task.type = "evolution";
    task.text = "improve yourself";
    EXPECT_EQ(builder.build(task, "google/gemini-x").cap, 4096);
}

TEST(SoftCapTest, KeepsSystemAndNewestMessagesWithinCap) {
    std::vector<Message> msgs = {
        sized("system", 400),      // 104 tokens
        sized("user", 400),
        sized("assistant", 400),
        sized("user", 400),
        sized("assistant", 400),
    };
    evoloop::CapReport report;
    auto out = evoloop::apply_soft_cap(msgs, 320, &report);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].role, "system");
    EXPECT_EQ(out[1].role, "user");
    EXPECT_EQ(out[2].role, "assistant");
    EXPECT_LE(evoloop::estimate_tokens(out), 320);
    EXPECT_EQ(report.requested_cap, 320);
    EXPECT_EQ(report.dropped_messages, 2u);
    EXPECT_EQ(report.actual_tokens, evoloop::estimate_tokens(out));
}

TEST(SoftCapTest, StopsAtFirstOverflowRatherThanSkipping) {
    std::vector<Message> msgs = {
        sized("system", 40),
        sized("user", 40),          // small, but older than the big one
        sized("assistant", 4000),   // does not fit
        sized("user", 40),
    };
    auto out = evoloop::apply_soft_cap(msgs, 200);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].content.size(), 40u);
    EXPECT_EQ(out[1].role, "user");
}

TEST(SoftCapTest, OrphanToolRepliesAreDropped) {
    Message assistant = sized("assistant", 2000);
    assistant.tool_calls.push_back({"c1", "repo_read", "{}"});
    Message tool = sized("tool", 200);
    tool.tool_call_id = "c1";
    std::vector<Message> msgs = {sized("system", 40), sized("user", 40), assistant, tool, sized("user", 40)};

    auto out = evoloop::apply_soft_cap(msgs, 120);
    for (auto& m : out) EXPECT_NE(m.role, "tool");
    EXPECT_EQ(out.back().role, "user");
}

TEST(SoftCapTest, UnderCapIsUntouched) {
    std::vector<Message> msgs = {sized("system", 40), sized("user", 40)};
    evoloop::CapReport report;
    auto out = evoloop::apply_soft_cap(msgs, 8192, &report);
    EXPECT_EQ(out.size(), 2u);
    EXPECT_EQ(report.dropped_messages, 0u);
}

TEST(ContextBuilderTest, SystemMessageHasThreeCacheLayers) {
    TempWorkspace ws;
    write_file(ws.repo() + "/BIBLE.md", "Principle one.");
    MemoryStore memory(ws.drive());
    memory.write_scratchpad("current plan");
    memory.write_identity("I am the agent.");
    memory.write_knowledge("free-model-ids", "# ids\nfree/one\n");
    FixedBudget budget;

    ContextBuilder builder(ContextConfig{}, Workspace{ws.repo(), ws.drive()}, memory, &budget,
                           []() { return int64_t{1700000000}; });
    Task task;
    task.id = "t-42";
    task.text = "do the thing";
    auto ctx = builder.build(task, "anthropic/claude-sonnet-4.6");

    ASSERT_EQ(ctx.messages.size(), 2u);
    const auto& sys = ctx.messages[0];
    ASSERT_EQ(sys.blocks.size(), 3u);
    EXPECT_EQ(sys.blocks[0].cache, evoloop::CacheHint::static_layer);
    EXPECT_NE(sys.blocks[0].text.find("Principle one."), std::string::npos);
    EXPECT_EQ(sys.blocks[1].cache, evoloop::CacheHint::semi_stable);
    EXPECT_NE(sys.blocks[1].text.find("current plan"), std::string::npos);
    EXPECT_NE(sys.blocks[1].text.find("free-model-ids"), std::string::npos);
    EXPECT_EQ(sys.blocks[2].cache, evoloop::CacheHint::dynamic);
    EXPECT_NE(sys.blocks[2].text.find("task_id: t-42"), std::string::npos);
    EXPECT_NE(sys.blocks[2].text.find("budget_remaining_usd: 8.75"), std::string::npos);
    EXPECT_NE(sys.blocks[2].text.find("2023-11-14T22:13:20Z"), std::string::npos);

    EXPECT_EQ(ctx.messages[1].role, "user");
    EXPECT_EQ(ctx.messages[1].content, "do the thing");
}

TEST(ContextBuilderTest, OversizedMemoryIsClipped) {
    TempWorkspace ws;
    MemoryStore memory(ws.drive());
    memory.write_scratchpad(std::string(500, 's'));
    ContextConfig cfg;
    cfg.scratchpad_max_chars = 100;
    ContextBuilder builder(cfg, Workspace{ws.repo(), ws.drive()}, memory);

    auto sys = builder.build_system(Task{});
    EXPECT_NE(sys.blocks[1].text.find("(clipped from 500 chars)"), std::string::npos);
}

TEST(ContextBuilderTest, ImageTaskUsesCaptionAndImageBlock) {
    TempWorkspace ws;
    MemoryStore memory(ws.drive());
    ContextBuilder builder(ContextConfig{}, Workspace{ws.repo(), ws.drive()}, memory);

    Task task;
    task.text = "what is this?";
    task.image_base64 = "aGVsbG8=";
    task.image_mime = "image/jpeg";
    auto user = builder.build_user(task);
    ASSERT_EQ(user.blocks.size(), 2u);
    EXPECT_EQ(user.blocks[0].text, "what is this?");
    EXPECT_EQ(user.blocks[1].kind, evoloop::ContentBlock::Kind::image);
    EXPECT_EQ(user.to_json()["content"][1]["image_url"]["url"], "data:image/jpeg;base64,aGVsbG8=");
}

TEST(ContextBuilderTest, HealthWarningsOnlyWhenSomethingIsWrong) {
    TempWorkspace ws;
    MemoryStore memory(ws.drive());
    memory.write_identity("me");
    write_file(ws.repo() + "/VERSION", "1.2.0\n");
    write_file(ws.repo() + "/README.md", "# Agent\n\n**Version:** 1.2.0\n");

    int64_t now = evoloop::epoch_now();
    ContextBuilder fresh(ContextConfig{}, Workspace{ws.repo(), ws.drive()}, memory,
                         nullptr, [now]() { return now; });
    EXPECT_TRUE(fresh.health_findings().empty());
    EXPECT_EQ(fresh.build_system(Task{}).blocks[2].text.find("Health warnings"), std::string::npos);

    write_file(ws.repo() + "/VERSION", "1.3.0\n");
    ContextBuilder stale(ContextConfig{}, Workspace{ws.repo(), ws.drive()}, memory,
                         nullptr, [now]() { return now + 9 * 3600; });
    auto findings = stale.health_findings();
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_NE(findings[0].find("1.3.0"), std::string::npos);
    EXPECT_NE(findings[1].find("identity.md"), std::string::npos);
    EXPECT_NE(stale.build_system(Task{}).blocks[2].text.find("## Health warnings"), std::string::npos);
}

TEST(WorkspaceTest, RepoHeadReadsBranchAndSha) {
    TempWorkspace ws;
    write_file(ws.repo() + "/.git/HEAD", "ref: refs/heads/main\n");
    write_file(ws.repo() + "/.git/refs/heads/main", "0123456789abcdef0123456789abcdef01234567\n");
    Workspace w{ws.repo(), ws.drive()};
    EXPECT_EQ(w.repo_head(), "main@0123456789ab");

    EXPECT_EQ((Workspace{ws.drive(), ws.drive()}.repo_head()), "");
}

} // namespace
