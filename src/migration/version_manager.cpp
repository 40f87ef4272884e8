#include "migration/version_manager.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/version_comparator.hpp"

#include <algorithm>

namespace sysupdate {

void VersionManager::Note(const std::string& line) {
    if (notes_) notes_->WriteLine(line);
}

std::string VersionManager::UnitPath(const std::string& identifier) {
    return "plugins/" + NamespacedToPath(identifier, '/');
}

Result VersionManager::EnsureCatalog(const IPlugin& plugin) {
    const std::string unit_path = UnitPath(plugin.Identifier());

    for (const auto& v : plugin.Versions()) {
        for (const auto& script : v.scripts) {
            std::shared_ptr<IMigration> m;
            auto r = plugin.LoadMigration(script, m);
            if (!r.is_ok()) return r;
            if (catalog_.Find(unit_path, m->Name())) continue;

            r = catalog_.Register(unit_path, std::move(m));
            if (!r.is_ok()) return r;
        }
    }
    return Result::Ok();
}

Result VersionManager::ApplyVersion(const IPlugin& plugin, const PluginVersion& version, bool& unit_exists) {
    const std::string code = plugin.Identifier();

    if (!version.scripts.empty()) {
        std::vector<std::string> only;
        for (const auto& script : version.scripts) {
            std::shared_ptr<IMigration> m;
            auto r = plugin.LoadMigration(script, m);
            if (!r.is_ok()) return r;
            only.push_back(m->Name());
        }

        Migrator::Options opt;
        opt.only = std::move(only);
        std::vector<std::string> applied;
        auto r = migrator_.Run(UnitPath(code), opt, applied);
        if (!r.is_ok()) return r;
    }

    for (const auto& script : version.scripts) {
        auto r = history_.Add({.code = code, .type = HistoryEntry::Type::Script,
                               .version = version.version, .detail = script});
        if (!r.is_ok()) return r;
    }
    for (const auto& note : version.notes) {
        auto r = history_.Add({.code = code, .type = HistoryEntry::Type::Comment,
                               .version = version.version, .detail = note});
        if (!r.is_ok()) return r;
    }

    if (unit_exists) {
        auto r = units_.SetVersion(code, version.version);
        if (!r.is_ok()) return r;
    } else {
        InstalledUnit unit;
        unit.code = code;
        unit.name = plugin.Name();
        unit.version = version.version;
        unit.icon = plugin.Icon();
        unit.is_disabled = plugin.IsDisabled();
        unit.created_at = FormatUtc(clock_.NowSeconds());
        auto r = units_.Save(unit);
        if (!r.is_ok()) return r;
        unit_exists = true;
    }

    Note(" - v" + version.version + ": " + (version.notes.empty() ? std::string() : version.notes.front()));
    return Result::Ok();
}

Result VersionManager::UpdatePlugin(const IPlugin& plugin) {
    const std::string code = plugin.Identifier();

    auto r = EnsureCatalog(plugin);
    if (!r.is_ok()) return r;

    std::optional<InstalledUnit> installed;
    r = units_.Find(code, installed);
    if (!r.is_ok()) return r;

    bool unit_exists = installed.has_value();
    const std::string current = installed ? installed->version : std::string();

    int applied = 0;
    for (const auto& v : plugin.Versions()) {
        if (!current.empty() && VersionComparator::Compare(v.version, current) <= 0) continue;

        r = ApplyVersion(plugin, v, unit_exists);
        if (!r.is_ok()) {
            LogError("Update of %s to %s failed: %s", code.c_str(), v.version.c_str(), r.msg.c_str());
            return r;
        }
        ++applied;
    }

    if (applied == 0) {
        Note(" - Nothing to update.");
    } else {
        LogInfo("Applied %d version(s) of %s", applied, code.c_str());
    }
    return Result::Ok();
}

Result VersionManager::RemovePlugin(const IPlugin& plugin,
                                    const std::optional<std::string>& stop_on_version,
                                    bool& removed) {
    const std::string code = plugin.Identifier();
    removed = false;

    auto r = EnsureCatalog(plugin);
    if (!r.is_ok()) return r;

    std::vector<std::string> versions;
    r = history_.Versions(code, versions);
    if (!r.is_ok()) return r;

    std::vector<HistoryEntry> entries;
    r = history_.ForPlugin(code, entries);
    if (!r.is_ok()) return r;

    for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
        const std::string& version = *it;
        if (stop_on_version && version == *stop_on_version) break;

        std::vector<std::string> names;
        for (const auto& e : entries) {
            if (e.version != version || e.type != HistoryEntry::Type::Script) continue;
            std::shared_ptr<IMigration> m;
            r = plugin.LoadMigration(e.detail, m);
            if (!r.is_ok()) return r;
            names.push_back(m->Name());
        }

        if (!names.empty()) {
            std::vector<std::string> rolled_back;
            r = migrator_.RollbackNamed(UnitPath(code), names, rolled_back);
            if (!r.is_ok()) return r;
        }

        r = history_.RemoveVersion(code, version);
        if (!r.is_ok()) return r;

        Note(" - Removed v" + version);
        removed = true;
    }

    std::optional<InstalledUnit> installed;
    r = units_.Find(code, installed);
    if (!r.is_ok()) return r;

    if (stop_on_version) {
        if (installed) {
            r = units_.SetVersion(code, *stop_on_version);
            if (!r.is_ok()) return r;
        }
    } else if (installed) {
        r = units_.Remove(code);
        if (!r.is_ok()) return r;
        removed = true;
    }
    return Result::Ok();
}

Result VersionManager::PurgePlugin(const std::string& code, bool& purged) {
    purged = false;

    int removed = 0;
    auto r = history_.RemoveAll(code, removed);
    if (!r.is_ok()) return r;

    std::optional<InstalledUnit> installed;
    r = units_.Find(code, installed);
    if (!r.is_ok()) return r;
    if (installed) {
        r = units_.Remove(code);
        if (!r.is_ok()) return r;
    }

    purged = removed > 0 || installed.has_value();
    return Result::Ok();
}

Result VersionManager::HasDatabaseVersion(const std::string& code, const std::string& version, bool& found) {
    return history_.HasVersion(code, version, found);
}

Result VersionManager::CurrentVersion(const std::string& code, std::optional<std::string>& out) {
    out.reset();
    std::optional<InstalledUnit> installed;
    auto r = units_.Find(code, installed);
    if (!r.is_ok()) return r;
    if (installed) out = installed->version;
    return Result::Ok();
}

Result VersionManager::CurrentVersionNote(const std::string& code, std::string& out) {
    out.clear();
    std::optional<std::string> current;
    auto r = CurrentVersion(code, current);
    if (!r.is_ok() || !current) return r;

    std::vector<HistoryEntry> entries;
    r = history_.ForPlugin(code, entries);
    if (!r.is_ok()) return r;

    for (const auto& e : entries) {
        if (e.version == *current && e.type == HistoryEntry::Type::Comment) {
            out = e.detail;
            break;
        }
    }
    return Result::Ok();
}

} // namespace sysupdate
