#pragma once
#include "utils.hpp"
#include <optional>
#include <string>
#include <vector>

namespace evoloop {

// Persistent agent memory under <drive>/memory: scratchpad, identity and a
// directory of knowledge entries with a generated index.
class MemoryStore {
public:
    explicit MemoryStore(const std::string& drive_root);

    std::string read_scratchpad() const;
    void write_scratchpad(const std::string& content);

    std::string read_identity() const;
    void write_identity(const std::string& content);
    std::string identity_path() const { return memory_dir_ + "/identity.md"; }
    // Last modification of identity.md, epoch seconds.
    std::optional<int64_t> identity_mtime() const;

    std::vector<std::string> list_topics() const;
    std::string read_knowledge(const std::string& topic) const;
    void write_knowledge(const std::string& topic, const std::string& content);
    // Non-empty trimmed lines of a knowledge entry.
    std::vector<std::string> knowledge_lines(const std::string& topic) const;
    std::string knowledge_index() const;

    // <drive>/state/state.json, raw text.
    std::string read_state() const;

    const std::string& drive_root() const { return drive_root_; }

private:
    std::string drive_root_;
    std::string memory_dir_;
    std::string knowledge_dir_;

    std::string topic_path(const std::string& topic) const;
    void rebuild_index();
};

} // namespace evoloop
