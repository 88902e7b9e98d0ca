#include "memory.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace evoloop {

MemoryStore::MemoryStore(const std::string& drive_root)
    : drive_root_(drive_root)
    , memory_dir_(drive_root + "/memory")
    , knowledge_dir_(drive_root + "/memory/knowledge")
{
    fs::create_directories(knowledge_dir_);
}

static void write_text(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::trunc);
    if (!f) throw std::runtime_error("Cannot write " + path);
    f << content;
}

std::string MemoryStore::read_scratchpad() const {
    return read_file(memory_dir_ + "/scratchpad.md");
}

void MemoryStore::write_scratchpad(const std::string& content) {
    write_text(memory_dir_ + "/scratchpad.md", content);
}

std::string MemoryStore::read_identity() const {
    return read_file(identity_path());
}

void MemoryStore::write_identity(const std::string& content) {
    write_text(identity_path(), content);
}

std::optional<int64_t> MemoryStore::identity_mtime() const {
    struct stat st{};
    if (::stat(identity_path().c_str(), &st) != 0) return std::nullopt;
    return static_cast<int64_t>(st.st_mtime);
}

std::string MemoryStore::topic_path(const std::string& topic) const {
    std::string t = safe_relpath(trim(topic));
    if (t.empty() || t.find('/') != std::string::npos || t.front() == '_') {
        throw std::invalid_argument("Invalid knowledge topic: '" + topic + "'");
    }
    if (t.size() > 3 && t.compare(t.size() - 3, 3, ".md") == 0) t.resize(t.size() - 3);
    return knowledge_dir_ + "/" + t + ".md";
}

std::vector<std::string> MemoryStore::list_topics() const {
    std::vector<std::string> topics;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(knowledge_dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        auto p = entry.path();
        if (p.extension() != ".md") continue;
        std::string stem = p.stem().string();
        if (!stem.empty() && stem.front() == '_') continue;
        topics.push_back(stem);
    }
    std::sort(topics.begin(), topics.end());
    return topics;
}

std::string MemoryStore::read_knowledge(const std::string& topic) const {
    return read_file(topic_path(topic));
}

void MemoryStore::write_knowledge(const std::string& topic, const std::string& content) {
    write_text(topic_path(topic), content);
    rebuild_index();
}

std::vector<std::string> MemoryStore::knowledge_lines(const std::string& topic) const {
    std::vector<std::string> out;
    for (auto& line : split(read_knowledge(topic), '\n')) {
        std::string t = trim(line);
        if (!t.empty() && t.front() != '#') out.push_back(t);
    }
    return out;
}

void MemoryStore::rebuild_index() {
    std::string idx = "# Knowledge index\n\n";
    for (auto& topic : list_topics()) {
        std::string first;
        for (auto& line : split(read_file(knowledge_dir_ + "/" + topic + ".md"), '\n')) {
            first = trim(line);
            if (!first.empty()) break;
        }
        idx += "- " + topic;
        if (!first.empty()) idx += ": " + first.substr(0, 120);
        idx += "\n";
    }
    write_text(knowledge_dir_ + "/_index.md", idx);
}

std::string MemoryStore::knowledge_index() const {
    return read_file(knowledge_dir_ + "/_index.md");
}

std::string MemoryStore::read_state() const {
    return read_file(drive_root_ + "/state/state.json");
}

} // namespace evoloop
