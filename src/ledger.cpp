#include "ledger.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <iostream>

namespace evoloop {

Ledger::Ledger(const std::string& db_path) {
    auto parent = fs::path(db_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open ledger DB: " + msg);
    }
    init_db();
}

Ledger::~Ledger() {
    if (db_) sqlite3_close(db_);
}

void Ledger::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS usage_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            ts INTEGER NOT NULL,
            task_id TEXT DEFAULT '',
            model TEXT NOT NULL,
            category TEXT DEFAULT '',
            prompt_tokens INTEGER DEFAULT 0,
            completion_tokens INTEGER DEFAULT 0,
            cached_tokens INTEGER DEFAULT 0,
            cache_write_tokens INTEGER DEFAULT 0,
            cost REAL DEFAULT 0,
            cost_estimated INTEGER DEFAULT 1
        );
        CREATE INDEX IF NOT EXISTS idx_usage_task ON usage_events(task_id);
        CREATE TABLE IF NOT EXISTS budget (
            key TEXT PRIMARY KEY,
            value REAL NOT NULL
        );
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to init ledger DB: " + msg);
    }
}

void Ledger::emit(const nlohmann::json& event) {
    if (!event.is_object() || event.value("type", "") != "llm_usage") return;

    LedgerEntry e;
    e.ts = epoch_now();
    e.task_id = event.value("task_id", "");
    e.model = event.value("model", "unknown");
    e.category = event.value("category", "");
    e.prompt_tokens = event.value("prompt_tokens", 0);
    e.completion_tokens = event.value("completion_tokens", 0);
    e.cached_tokens = event.value("cached_tokens", 0);
    e.cache_write_tokens = event.value("cache_write_tokens", 0);
    e.cost = event.value("cost", 0.0);
    e.cost_estimated = event.value("cost_estimated", true);
    try {
        record(e);
    } catch (const std::exception& ex) {
        std::cerr << "[ledger] " << ex.what() << "\n";
    }
}

int64_t Ledger::record(const LedgerEntry& entry) {
    const char* sql = "INSERT INTO usage_events (ts, task_id, model, category, prompt_tokens, "
                      "completion_tokens, cached_tokens, cache_write_tokens, cost, cost_estimated) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare ledger insert: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_int64(stmt, 1, entry.ts ? entry.ts : epoch_now());
    sqlite3_bind_text(stmt, 2, entry.task_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, entry.model.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, entry.category.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, entry.prompt_tokens);
    sqlite3_bind_int64(stmt, 6, entry.completion_tokens);
    sqlite3_bind_int64(stmt, 7, entry.cached_tokens);
    sqlite3_bind_int64(stmt, 8, entry.cache_write_tokens);
    sqlite3_bind_double(stmt, 9, entry.cost);
    sqlite3_bind_int(stmt, 10, entry.cost_estimated ? 1 : 0);

    int rc = sqlite3_step(stmt);
    int64_t id = sqlite3_last_insert_rowid(db_);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to record usage event");
    }
    return id;
}

void Ledger::set_total_budget(double usd) {
    const char* sql = "INSERT INTO budget (key, value) VALUES ('total_usd', ?) "
                      "ON CONFLICT(key) DO UPDATE SET value = excluded.value";
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare budget update: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_double(stmt, 1, usd);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to store total budget");
    }
}

double Ledger::query_double(const char* sql, const std::string& bind) const {
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare ledger query: " + std::string(sqlite3_errmsg(db_)));
    }
    if (!bind.empty()) sqlite3_bind_text(stmt, 1, bind.c_str(), -1, SQLITE_TRANSIENT);
    double value = 0.0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_double(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

double Ledger::total_budget() const {
    return query_double("SELECT value FROM budget WHERE key = 'total_usd'");
}

double Ledger::total_spent() const {
    return query_double("SELECT COALESCE(SUM(cost), 0) FROM usage_events");
}

double Ledger::spent_for_task(const std::string& task_id) const {
    return query_double("SELECT COALESCE(SUM(cost), 0) FROM usage_events WHERE task_id = ?", task_id);
}

BudgetSnapshot Ledger::budget_snapshot() const {
    BudgetSnapshot s;
    s.spent = total_spent();
    s.total = total_budget();
    return s;
}

static std::string column_string(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::vector<LedgerEntry> Ledger::recent(int limit) const {
    std::vector<LedgerEntry> out;
    const char* sql = "SELECT id, ts, task_id, model, category, prompt_tokens, completion_tokens, "
                      "cached_tokens, cache_write_tokens, cost, cost_estimated "
                      "FROM usage_events ORDER BY id DESC LIMIT ?";
    std::lock_guard<std::mutex> lock(mu_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare ledger query: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_int(stmt, 1, limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        LedgerEntry e;
        e.id = sqlite3_column_int64(stmt, 0);
        e.ts = sqlite3_column_int64(stmt, 1);
        e.task_id = column_string(stmt, 2);
        e.model = column_string(stmt, 3);
        e.category = column_string(stmt, 4);
        e.prompt_tokens = sqlite3_column_int64(stmt, 5);
        e.completion_tokens = sqlite3_column_int64(stmt, 6);
        e.cached_tokens = sqlite3_column_int64(stmt, 7);
        e.cache_write_tokens = sqlite3_column_int64(stmt, 8);
        e.cost = sqlite3_column_double(stmt, 9);
        e.cost_estimated = sqlite3_column_int(stmt, 10) != 0;
        out.push_back(std::move(e));
    }
    sqlite3_finalize(stmt);
    return out;
}

} // namespace evoloop
