#pragma once

#include "migration/migration.hpp"
#include "util/result.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sysupdate {

// Known migrations per unit path. Paths are the logical keys stored in the
// ledger, so the same catalog answers "what is pending" and "how to undo".
class MigrationCatalog {
  public:
    // Fails when the unit already has a migration of the same name.
    Result Register(const std::string& unit_path, std::shared_ptr<IMigration> migration);

    // Registers every SQL migration pair found in `dir` under `unit_path`.
    Result LoadDirectory(const std::string& unit_path, const std::string& dir);

    bool HasUnit(const std::string& unit_path) const;

    // Sorted by name.
    std::vector<IMigration*> For(const std::string& unit_path) const;
    IMigration* Find(const std::string& unit_path, const std::string& name) const;

  private:
    std::map<std::string, std::map<std::string, std::shared_ptr<IMigration>>> units_;
};

} // namespace sysupdate
