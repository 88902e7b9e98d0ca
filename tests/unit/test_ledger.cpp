#include <filesystem>
#include <string>
#include <unistd.h>
#include <gtest/gtest.h>
#include "ledger.hpp"

namespace {

using evoloop::Ledger;
using evoloop::LedgerEntry;

nlohmann::json usage_event(const std::string& task, double cost, bool estimated = true) {
    return {
        {"type", "llm_usage"},
        {"task_id", task},
        {"model", "a/b"},
        {"category", "user"},
        {"prompt_tokens", 100},
        {"completion_tokens", 20},
        {"cost", cost},
        {"cost_estimated", estimated}
    };
}

TEST(LedgerTest, RecordsOnlyUsageEvents) {
    Ledger ledger(":memory:");
    ledger.emit(usage_event("t1", 0.25));
    ledger.emit({{"type", "tool_error"}, {"task_id", "t1"}});
    ledger.emit(usage_event("t2", 0.5, false));

    auto recent = ledger.recent();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].task_id, "t2");
    EXPECT_FALSE(recent[0].cost_estimated);
    EXPECT_EQ(recent[1].prompt_tokens, 100);
    EXPECT_NEAR(ledger.total_spent(), 0.75, 1e-9);
    EXPECT_NEAR(ledger.spent_for_task("t1"), 0.25, 1e-9);
    EXPECT_DOUBLE_EQ(ledger.spent_for_task("missing"), 0.0);
}

TEST(LedgerTest, BudgetSnapshotReportsRemaining) {
    Ledger ledger(":memory:");
    EXPECT_DOUBLE_EQ(ledger.total_budget(), 0.0);
    ledger.set_total_budget(10.0);
    ledger.set_total_budget(4.0);
    ledger.emit(usage_event("t", 1.5));

    auto snap = ledger.budget_snapshot();
    EXPECT_DOUBLE_EQ(snap.total, 4.0);
    EXPECT_NEAR(snap.spent, 1.5, 1e-9);
    EXPECT_NEAR(snap.remaining(), 2.5, 1e-9);
}

TEST(LedgerTest, SpendSurvivesReopen) {
    auto path = std::filesystem::temp_directory_path() /
                ("evoloop_ledger_" + std::to_string(::getpid())) / "ledger.db";
    {
        Ledger ledger(path.string());
        LedgerEntry e;
        e.task_id = "t";
        e.model = "a/b";
        e.cost = 0.125;
        EXPECT_GT(ledger.record(e), 0);
    }
    {
        Ledger ledger(path.string());
        EXPECT_NEAR(ledger.total_spent(), 0.125, 1e-9);
    }
    std::error_code ec;
    std::filesystem::remove_all(path.parent_path(), ec);
}

} // namespace
