#include "memory_tool.hpp"
#include "../memory.hpp"
#include <stdexcept>

namespace evoloop {

static nlohmann::json content_params() {
    return nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "content": {"type": "string"}
        },
        "required": ["content"]
    })JSON");
}

void register_memory_tools(ToolRegistry& reg) {
    // ── update_scratchpad ──
    {
        ToolDef def;
        def.name = "update_scratchpad";
        def.description = "Replace the working scratchpad. It is shown in every round's context.";
        def.parameters = content_params();
        def.policy = ToolPolicy::stateful;
        def.func = [](const ToolContext& ctx, const nlohmann::json& args) -> std::string {
            std::string content = args.value("content", "");
            MemoryStore(ctx.drive_root).write_scratchpad(content);
            return "Scratchpad updated (" + std::to_string(content.size()) + " chars)";
        };
        reg.register_tool(std::move(def));
    }

    // ── update_identity ──
    {
        ToolDef def;
        def.name = "update_identity";
        def.description = "Rewrite identity.md: who you are, what you value, how you work.";
        def.parameters = content_params();
        def.policy = ToolPolicy::stateful;
        def.func = [](const ToolContext& ctx, const nlohmann::json& args) -> std::string {
            std::string content = args.value("content", "");
            if (trim(content).empty()) throw std::runtime_error("identity content must not be empty");
            MemoryStore(ctx.drive_root).write_identity(content);
            return "Identity updated (" + std::to_string(content.size()) + " chars)";
        };
        reg.register_tool(std::move(def));
    }

    // ── knowledge_read ──
    {
        ToolDef def;
        def.name = "knowledge_read";
        def.description = "Read a knowledge entry by topic. Without a topic, lists all topics.";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "topic": {"type": "string"}
            }
        })JSON");
        def.policy = ToolPolicy::read_only_parallel;
        def.func = [](const ToolContext& ctx, const nlohmann::json& args) -> std::string {
            MemoryStore store(ctx.drive_root);
            std::string topic = args.value("topic", "");
            if (topic.empty()) {
                auto topics = store.list_topics();
                if (topics.empty()) return "(no knowledge entries)";
                std::string out;
                for (auto& t : topics) out += t + "\n";
                return out;
            }
            std::string text = store.read_knowledge(topic);
            if (text.empty()) throw std::runtime_error("No knowledge entry for topic '" + topic + "'");
            return text;
        };
        reg.register_tool(std::move(def));
    }

    // ── knowledge_write ──
    {
        ToolDef def;
        def.name = "knowledge_write";
        def.description = "Create or replace a knowledge entry. The index is rebuilt.";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "topic": {"type": "string"},
                "content": {"type": "string"}
            },
            "required": ["topic", "content"]
        })JSON");
        def.policy = ToolPolicy::stateful;
        def.func = [](const ToolContext& ctx, const nlohmann::json& args) -> std::string {
            std::string topic = args.value("topic", "");
            if (topic.empty()) throw std::runtime_error("topic is required");
            std::string content = args.value("content", "");
            MemoryStore(ctx.drive_root).write_knowledge(topic, content);
            return "Knowledge entry '" + topic + "' saved (" + std::to_string(content.size()) + " chars)";
        };
        reg.register_tool(std::move(def));
    }
}

} // namespace evoloop
