#pragma once

#include "store/database.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sysupdate {

struct InstalledUnit {
    std::string code;
    std::string name;
    std::string version;
    std::string icon;
    bool is_frozen = false;
    bool is_updatable = true;
    bool is_disabled = false;
    std::string created_at;
};

// Installed plugin records, one row per code.
class UnitRepository {
public:
    explicit UnitRepository(Database& db) : db_(db) {}

    Result Init();

    Result All(std::vector<InstalledUnit>& out);
    Result Find(const std::string& code, std::optional<InstalledUnit>& out);
    Result Save(const InstalledUnit& unit);
    Result SetVersion(const std::string& code, const std::string& version);
    Result Remove(const std::string& code);

    // Earliest created_at across all units, if any exist.
    Result OldestCreatedAt(std::optional<std::string>& out);

private:
    Database& db_;
};

} // namespace sysupdate
