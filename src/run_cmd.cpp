#include "run_cmd.hpp"
#include "agent.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "memory.hpp"
#include "provider_router.hpp"
#include "tools/exec_tool.hpp"
#include "tools/fs_tools.hpp"
#include "tools/memory_tool.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace evoloop {

std::string read_file_base64(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot read image: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string raw = ss.str();

    std::string out(4 * ((raw.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(raw.data()),
                            static_cast<int>(raw.size()));
    if (n < 0) throw std::runtime_error("Base64 encoding failed: " + path);
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string image_mime_for(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".webp") return "image/webp";
    return "image/png";
}

static std::string new_task_id() {
    std::random_device rd;
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << (rd() & 0xffffffffu);
    return ss.str();
}

int cmd_run(const RunOptions& opts) {
    if (trim(opts.message).empty() && opts.image_path.empty()) {
        std::cerr << "Usage: evoloop run -m MSG [--type T] [--model M] [--budget USD] [--image PATH]\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    if (!opts.model.empty()) cfg.model = opts.model;

    std::string drive = cfg.drive_root();
    std::string logs = cfg.logs_dir();

    try {
        auto ledger = std::make_shared<Ledger>(drive + "/state/ledger.db");
        if (cfg.budget.total_usd > 0.0) ledger->set_total_budget(cfg.budget.total_usd);

        auto events = std::make_shared<TeeEventSink>();
        events->add(std::make_shared<JsonlLog>(logs + "/events.jsonl"));
        events->add(ledger);

        AgentLogs agent_logs;
        agent_logs.events = events;
        agent_logs.tools = std::make_shared<JsonlLog>(logs + "/tools.jsonl");
        agent_logs.rounds = std::make_shared<JsonlLog>(logs + "/rounds.jsonl");

        PricingFetcher fetcher;
        if (cfg.pricing.refresh) {
            std::string base = cfg.pricing.source_base;
            fetcher = [base]() { return fetch_openrouter_pricing(base); };
        }
        PricingCache pricing(default_pricing_table(), fetcher, nullptr,
                             cfg.pricing.ttl_sec, cfg.pricing.min_live_entries);

        MemoryStore memory(drive);
        ProviderRouter router(cfg.routing, pricing);
        router.add_whitelist(memory.knowledge_lines("free-model-ids"));
        RoutedClient client(router, cfg.request_timeout_sec);

        Workspace ws{cfg.repo_path(), drive};
        ContextBuilder context(cfg.context, ws, memory, ledger.get());

        ToolRegistry tools;
        register_fs_tools(tools);
        register_memory_tools(tools);
        register_exec_tool(tools);

        Task task;
        task.id = new_task_id();
        task.type = opts.type;
        task.text = opts.message;
        task.reasoning_effort = normalize_reasoning_effort(opts.reasoning_effort);
        if (!opts.image_path.empty()) {
            task.image_base64 = read_file_base64(opts.image_path);
            task.image_mime = image_mime_for(opts.image_path);
            task.image_caption = opts.message;
        }
        if (opts.budget_usd > 0.0) {
            task.budget_usd = opts.budget_usd;
        } else {
            auto snap = ledger->budget_snapshot();
            if (snap.total > 0.0) task.budget_usd = snap.remaining();
        }

        std::cerr << "[agent] Task " << task.id << " (" << task.type << ") on " << cfg.model << "\n";
        Agent agent(cfg, tools, client, pricing, context, agent_logs);
        RunOutcome out = agent.run(task);

        std::cout << out.text << "\n";
        std::cerr << std::fixed << std::setprecision(4)
                  << "[agent] " << termination_name(out.reason) << " | rounds " << out.rounds
                  << " | model " << out.model << " | $" << out.usage.cost
                  << " | " << out.usage.prompt_tokens << " in / " << out.usage.completion_tokens
                  << " out\n";
        return out.ok() || out.reason == Termination::budget_exhausted ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
}

} // namespace evoloop
