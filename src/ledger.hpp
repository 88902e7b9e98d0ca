#pragma once
#include "event_log.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <mutex>
#include <sqlite3.h>

namespace evoloop {

struct BudgetSnapshot {
    double spent = 0.0;
    double total = 0.0;
    double remaining() const { return total > spent ? total - spent : 0.0; }
};

// Read accessor for spent/total currency units.
class BudgetSource {
public:
    virtual ~BudgetSource() = default;
    virtual BudgetSnapshot budget_snapshot() const = 0;
};

struct LedgerEntry {
    int64_t id = 0;
    int64_t ts = 0;
    std::string task_id;
    std::string model;
    std::string category;
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    int64_t cached_tokens = 0;
    int64_t cache_write_tokens = 0;
    double cost = 0.0;
    bool cost_estimated = true;
};

// SQLite-backed usage ledger. Persists every llm_usage event it receives and
// the allotted total budget; other event types are ignored.
class Ledger : public EventSink, public BudgetSource {
public:
    explicit Ledger(const std::string& db_path);
    ~Ledger() override;

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    void emit(const nlohmann::json& event) override;
    BudgetSnapshot budget_snapshot() const override;

    int64_t record(const LedgerEntry& entry);
    void set_total_budget(double usd);
    double total_budget() const;
    double total_spent() const;
    double spent_for_task(const std::string& task_id) const;
    std::vector<LedgerEntry> recent(int limit = 20) const;

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mu_;
    void init_db();
    double query_double(const char* sql, const std::string& bind = "") const;
};

} // namespace evoloop
