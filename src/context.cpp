#include "context.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace evoloop {

static const char* BASE_INSTRUCTIONS =
    "You are an autonomous agent working inside a git repository.\n"
    "Work in rounds: think, call tools, read their results, continue.\n"
    "When the task is complete, answer with plain text and no tool calls.\n"
    "Keep track of cost: every round spends budget.\n";

// ── Workspace ────────────────────────────────────────────────────────

std::string Workspace::repo_head() const {
    std::string head = trim(read_file(repo_dir + "/.git/HEAD"));
    if (head.empty()) return "";
    if (starts_with(head, "ref: ")) {
        std::string ref = head.substr(5);
        std::string sha = trim(read_file(repo_dir + "/.git/" + ref));
        if (sha.empty()) {
            // Packed refs: "<sha> <ref>"
            for (auto& line : split(read_file(repo_dir + "/.git/packed-refs"), '\n')) {
                auto sp = line.find(' ');
                if (sp != std::string::npos && trim(line.substr(sp + 1)) == ref) {
                    sha = line.substr(0, sp);
                    break;
                }
            }
        }
        std::string branch = ref.substr(ref.rfind('/') + 1);
        return sha.empty() ? branch : branch + "@" + sha.substr(0, 12);
    }
    return head.substr(0, 12);
}

std::string Workspace::read_repo(const std::string& rel) const {
    return read_file(repo_dir + "/" + safe_relpath(rel));
}

// ── ContextBuilder ───────────────────────────────────────────────────

ContextBuilder::ContextBuilder(const ContextConfig& cfg, Workspace ws, MemoryStore& memory,
                               const BudgetSource* budget, EpochClock clock)
    : cfg_(cfg)
    , ws_(std::move(ws))
    , memory_(memory)
    , budget_(budget)
    , clock_(clock ? std::move(clock) : EpochClock(epoch_now))
{}

int ContextBuilder::soft_cap_for(const std::string& model, const std::string& task_type) const {
    int cap = cfg_.default_cap;
    for (auto& prefix : cfg_.low_throughput_prefixes) {
        if (starts_with(model, prefix)) {
            cap = cfg_.low_throughput_cap;
            break;
        }
    }
    if (task_type == "evolution") cap = std::min(cap, cfg_.low_throughput_cap);
    return cap;
}

static std::string or_fallback(const std::string& text, const std::string& fallback) {
    return trim(text).empty() ? fallback : text;
}

std::string ContextBuilder::static_layer() const {
    std::string base = ws_.read_repo("prompts/SYSTEM.md");
    std::string bible = ws_.read_repo("BIBLE.md");

    std::string out = or_fallback(base, BASE_INSTRUCTIONS);
    out += "\n\n## BIBLE.md\n\n";
    out += clip_text(or_fallback(bible, "(BIBLE.md not found)"), cfg_.bible_max_chars);
    return out;
}

std::string ContextBuilder::semi_stable_layer() const {
    std::string out;
    out += "## Scratchpad\n\n";
    out += clip_text(or_fallback(memory_.read_scratchpad(), "(empty scratchpad)"), cfg_.scratchpad_max_chars);
    out += "\n\n## Identity\n\n";
    out += clip_text(or_fallback(memory_.read_identity(), "(no identity yet)"), cfg_.identity_max_chars);
    out += "\n\n## Knowledge index\n\n";
    out += clip_text(or_fallback(memory_.knowledge_index(), "(no knowledge entries)"),
                     cfg_.knowledge_index_max_chars);
    return out;
}

static std::string readme_version(const std::string& readme) {
    const std::string marker = "**Version:**";
    for (auto& line : split(readme, '\n')) {
        if (starts_with(line, marker)) return trim(line.substr(marker.size()));
    }
    return "";
}

std::vector<std::string> ContextBuilder::health_findings() const {
    std::vector<std::string> findings;

    std::string version = trim(ws_.read_repo("VERSION"));
    std::string readme_ver = readme_version(ws_.read_repo("README.md"));
    if (!version.empty() && !readme_ver.empty() && version != readme_ver) {
        findings.push_back("VERSION (" + version + ") does not match README.md (" + readme_ver + ")");
    }

    auto mtime = memory_.identity_mtime();
    if (mtime) {
        int64_t age_h = (clock_() - *mtime) / 3600;
        if (age_h >= cfg_.identity_stale_hours) {
            findings.push_back("identity.md has not been updated for " + std::to_string(age_h) + "h");
        }
    }
    return findings;
}

std::string ContextBuilder::dynamic_layer(const Task& task) const {
    std::ostringstream out;
    out << "## State\n\n";
    out << clip_text(or_fallback(memory_.read_state(), "{}"), cfg_.state_max_chars);

    out << "\n\n## Runtime\n\n";
    out << "utc_now: " << utc_iso(clock_()) << "\n";
    std::string head = ws_.repo_head();
    out << "repo_head: " << (head.empty() ? "unknown" : head) << "\n";
    out << "task_id: " << task.id << "\n";
    out << "task_type: " << task.type << "\n";
    if (budget_) {
        auto b = budget_->budget_snapshot();
        out << std::fixed << std::setprecision(2)
            << "budget_remaining_usd: " << b.remaining()
            << " (spent " << b.spent << " of " << b.total << ")\n";
    }

    auto findings = health_findings();
    if (!findings.empty()) {
        out << "\n## Health warnings\n\n";
        for (auto& f : findings) out << "- " << f << "\n";
    }
    return out.str();
}

Message ContextBuilder::build_system(const Task& task) const {
    Message sys;
    sys.role = "system";
    sys.blocks.push_back(ContentBlock::make_text(static_layer(), CacheHint::static_layer));
    sys.blocks.push_back(ContentBlock::make_text(semi_stable_layer(), CacheHint::semi_stable));
    sys.blocks.push_back(ContentBlock::make_text(dynamic_layer(task), CacheHint::dynamic));
    return sys;
}

Message ContextBuilder::build_user(const Task& task) const {
    Message user;
    user.role = "user";
    if (task.has_image()) {
        std::string caption = !task.image_caption.empty() ? task.image_caption : task.text;
        user.blocks.push_back(ContentBlock::make_text(or_fallback(caption, "(image attached)")));
        user.blocks.push_back(ContentBlock::make_image(task.image_base64, task.image_mime));
        return user;
    }
    user.content = or_fallback(task.text, "(empty message)");
    return user;
}

BuiltContext ContextBuilder::build(const Task& task, const std::string& model) const {
    BuiltContext ctx;
    ctx.messages.push_back(build_system(task));
    ctx.messages.push_back(build_user(task));
    ctx.cap = soft_cap_for(model, task.type);
    return ctx;
}

// ── Capping ──────────────────────────────────────────────────────────

std::vector<Message> apply_soft_cap(const std::vector<Message>& messages, int cap,
                                    CapReport* report) {
    int total = estimate_tokens(messages);
    if (total <= cap || messages.empty()) {
        if (report) *report = CapReport{cap, total, 0};
        return messages;
    }

    bool has_system = messages.front().role == "system";
    size_t first = has_system ? 1 : 0;
    int used = has_system ? estimate_tokens(messages.front()) : 0;

    size_t keep_from = messages.size();
    for (size_t i = messages.size(); i > first; i--) {
        int t = estimate_tokens(messages[i - 1]);
        if (used + t > cap) break;
        used += t;
        keep_from = i - 1;
    }

    // A tool reply must follow the assistant message that requested it.
    while (keep_from < messages.size() && messages[keep_from].role == "tool") {
        used -= estimate_tokens(messages[keep_from]);
        keep_from++;
    }

    std::vector<Message> out;
    out.reserve(messages.size() - keep_from + 1);
    if (has_system) out.push_back(messages.front());
    for (size_t i = keep_from; i < messages.size(); i++) out.push_back(messages[i]);

    if (report) *report = CapReport{cap, used, messages.size() - out.size()};
    return out;
}

} // namespace evoloop
