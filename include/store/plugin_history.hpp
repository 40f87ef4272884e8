#pragma once

#include "store/database.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sysupdate {

struct HistoryEntry {
    enum class Type { Script, Comment };

    std::int64_t id = 0;
    std::string code;
    Type type = Type::Comment;
    std::string version;
    std::string detail;
};

// Which version of a plugin introduced which scripts and notes.
class PluginHistory {
public:
    explicit PluginHistory(Database& db) : db_(db) {}

    Result Init();

    Result Add(const HistoryEntry& entry);
    Result ForPlugin(const std::string& code, std::vector<HistoryEntry>& out);

    // Distinct versions in the order they were first recorded.
    Result Versions(const std::string& code, std::vector<std::string>& out);
    Result HasVersion(const std::string& code, const std::string& version, bool& found);

    Result RemoveVersion(const std::string& code, const std::string& version);
    Result RemoveAll(const std::string& code, int& removed);

private:
    Database& db_;
};

} // namespace sysupdate
