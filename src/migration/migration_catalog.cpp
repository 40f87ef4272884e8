#include "migration/migration_catalog.hpp"

#include "migration/sql_file_migration.hpp"

namespace sysupdate {

Result MigrationCatalog::Register(const std::string& unit_path, std::shared_ptr<IMigration> migration) {
    if (!migration) {
        return Result::Fail(ErrorCode::Migration, "null migration for " + unit_path);
    }

    auto& unit = units_[unit_path];
    const std::string name = migration->Name();
    if (unit.count(name)) {
        return Result::Fail(ErrorCode::Migration, "duplicate migration " + name + " in " + unit_path);
    }
    unit.emplace(name, std::move(migration));
    return Result::Ok();
}

Result MigrationCatalog::LoadDirectory(const std::string& unit_path, const std::string& dir) {
    std::vector<std::shared_ptr<IMigration>> found;
    auto r = DiscoverSqlMigrations(dir, found);
    if (!r.is_ok()) return r;

    units_[unit_path];
    for (auto& m : found) {
        r = Register(unit_path, std::move(m));
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

bool MigrationCatalog::HasUnit(const std::string& unit_path) const {
    return units_.count(unit_path) != 0;
}

std::vector<IMigration*> MigrationCatalog::For(const std::string& unit_path) const {
    std::vector<IMigration*> out;
    auto it = units_.find(unit_path);
    if (it == units_.end()) return out;

    out.reserve(it->second.size());
    for (const auto& [name, m] : it->second) out.push_back(m.get());
    return out;
}

IMigration* MigrationCatalog::Find(const std::string& unit_path, const std::string& name) const {
    auto it = units_.find(unit_path);
    if (it == units_.end()) return nullptr;
    auto m = it->second.find(name);
    return m == it->second.end() ? nullptr : m->second.get();
}

} // namespace sysupdate
