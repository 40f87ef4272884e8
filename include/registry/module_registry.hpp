#pragma once

#include "migration/migration.hpp"
#include "migration/migration_catalog.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sysupdate {

struct ModuleDefinition {
    std::string name;
    // Registered next to the SQL files found in the module directory.
    std::vector<std::shared_ptr<IMigration>> migrations;
    std::shared_ptr<ISeeder> seeder;
};

// Core modules. Their migrations live under
// {base_dir}/modules/<lower name>/database/migrations.
class ModuleRegistry {
  public:
    explicit ModuleRegistry(std::string base_dir) : base_dir_(std::move(base_dir)) {}

    // Replaces an earlier definition of the same name.
    void Register(ModuleDefinition def);
    const ModuleDefinition* Find(const std::string& name) const;

    // Ledger key: "modules/<lower name>/database/migrations".
    static std::string UnitPath(const std::string& module);
    std::string MigrationsDir(const std::string& module) const;

    // Fills the catalog for `module` unless already loaded.
    Result LoadInto(const std::string& module, MigrationCatalog& catalog) const;

  private:
    std::string base_dir_;
    std::vector<ModuleDefinition> modules_;
};

} // namespace sysupdate
