#pragma once
#include "config.hpp"
#include "ledger.hpp"
#include "memory.hpp"
#include "message.hpp"
#include "task.hpp"
#include <string>
#include <vector>

namespace evoloop {

// Read access to the repository and drive the agent works in.
struct Workspace {
    std::string repo_dir;
    std::string drive_root;

    // Short commit id from .git/HEAD, or "" outside a repository.
    std::string repo_head() const;
    std::string read_repo(const std::string& rel) const;
};

struct BuiltContext {
    std::vector<Message> messages;   // [system, user]
    int cap = 0;
};

class ContextBuilder {
public:
    ContextBuilder(const ContextConfig& cfg, Workspace ws, MemoryStore& memory,
                   const BudgetSource* budget = nullptr, EpochClock clock = nullptr);

    BuiltContext build(const Task& task, const std::string& model) const;

    // Three cache-tagged blocks: static, semi-stable, dynamic.
    Message build_system(const Task& task) const;
    Message build_user(const Task& task) const;

    int soft_cap_for(const std::string& model, const std::string& task_type) const;

    // VERSION/README drift, stale identity. Empty when all is well.
    std::vector<std::string> health_findings() const;

private:
    ContextConfig cfg_;
    Workspace ws_;
    MemoryStore& memory_;
    const BudgetSource* budget_;
    EpochClock clock_;

    std::string static_layer() const;
    std::string semi_stable_layer() const;
    std::string dynamic_layer(const Task& task) const;
};

// Keeps the leading system message and the newest messages that fit in cap.
// Stops at the first message that would overflow; tool replies left without
// their assistant call are dropped from the front.
std::vector<Message> apply_soft_cap(const std::vector<Message>& messages, int cap,
                                    CapReport* report = nullptr);

} // namespace evoloop
