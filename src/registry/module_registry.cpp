#include "registry/module_registry.hpp"

#include "util/path_utils.hpp"

#include <filesystem>

namespace sysupdate {

void ModuleRegistry::Register(ModuleDefinition def) {
    const std::string key = ToLower(def.name);
    for (auto& m : modules_) {
        if (ToLower(m.name) == key) {
            m = std::move(def);
            return;
        }
    }
    modules_.push_back(std::move(def));
}

const ModuleDefinition* ModuleRegistry::Find(const std::string& name) const {
    const std::string key = ToLower(name);
    for (const auto& m : modules_) {
        if (ToLower(m.name) == key) return &m;
    }
    return nullptr;
}

std::string ModuleRegistry::UnitPath(const std::string& module) {
    return "modules/" + ToLower(module) + "/database/migrations";
}

std::string ModuleRegistry::MigrationsDir(const std::string& module) const {
    return (std::filesystem::path(base_dir_) / UnitPath(module)).string();
}

Result ModuleRegistry::LoadInto(const std::string& module, MigrationCatalog& catalog) const {
    const std::string unit_path = UnitPath(module);
    if (catalog.HasUnit(unit_path)) return Result::Ok();

    auto r = catalog.LoadDirectory(unit_path, MigrationsDir(module));
    if (!r.is_ok()) return r;

    if (const auto* def = Find(module)) {
        for (const auto& m : def->migrations) {
            r = catalog.Register(unit_path, m);
            if (!r.is_ok()) return r;
        }
    }
    return Result::Ok();
}

} // namespace sysupdate
