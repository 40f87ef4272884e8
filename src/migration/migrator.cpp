#include "migration/migrator.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <set>

namespace sysupdate {

void Migrator::Note(const std::string& line) {
    if (notes_) notes_->WriteLine(line);
}

Result Migrator::CollectPending(const std::vector<std::string>& unit_paths,
                                const Options& opt,
                                std::vector<Pending>& out) {
    out.clear();

    std::set<std::pair<std::string, std::string>> ran;
    for (const auto& path : unit_paths) {
        std::vector<std::string> names;
        auto r = ledger_.Ran(path, names);
        if (!r.is_ok()) return r;
        for (auto& n : names) ran.emplace(path, std::move(n));
    }

    if (!opt.only.empty()) {
        for (const auto& name : opt.only) {
            bool found = false;
            for (const auto& path : unit_paths) {
                IMigration* m = catalog_.Find(path, name);
                if (!m) continue;
                found = true;
                if (!ran.count({path, name})) out.push_back({path, m});
                break;
            }
            if (!found) {
                return Result::Fail(ErrorCode::Migration, "Migration not found: " + name);
            }
        }
        return Result::Ok();
    }

    for (const auto& path : unit_paths) {
        for (IMigration* m : catalog_.For(path)) {
            if (!ran.count({path, m->Name()})) out.push_back({path, m});
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const Pending& a, const Pending& b) {
        return a.migration->Name() < b.migration->Name();
    });
    return Result::Ok();
}

Result Migrator::RunUp(const Pending& p, int batch) {
    const std::string name = p.migration->Name();

    Transaction tx(db_);
    auto r = tx.Begin();
    if (!r.is_ok()) return r;

    std::vector<std::string> reported;
    r = p.migration->Up(db_, reported);
    if (!r.is_ok()) {
        LogError("Migration %s failed: %s", name.c_str(), r.msg.c_str());
        return r;
    }

    r = ledger_.Log(p.unit_path, name, batch);
    if (!r.is_ok()) return r;

    r = tx.Commit();
    if (!r.is_ok()) return r;

    notices_.Add(name, reported);
    return Result::Ok();
}

Result Migrator::RunDown(const LedgerEntry& entry, IMigration& migration) {
    Transaction tx(db_);
    auto r = tx.Begin();
    if (!r.is_ok()) return r;

    r = migration.Down(db_);
    if (!r.is_ok()) {
        LogError("Rollback of %s failed: %s", entry.migration.c_str(), r.msg.c_str());
        return r;
    }

    r = ledger_.Delete(entry.unit_path, entry.migration);
    if (!r.is_ok()) return r;

    return tx.Commit();
}

Result Migrator::Run(const std::string& unit_path, const Options& opt, std::vector<std::string>& applied) {
    return Run(std::vector<std::string>{unit_path}, opt, applied);
}

Result Migrator::Run(const std::vector<std::string>& unit_paths,
                     const Options& opt,
                     std::vector<std::string>& applied) {
    applied.clear();

    std::vector<Pending> pending;
    auto r = CollectPending(unit_paths, opt, pending);
    if (!r.is_ok()) return r;

    if (pending.empty()) {
        Note("Nothing to migrate.");
        return Result::Ok();
    }

    int batch = 0;
    r = ledger_.LastBatchNumber(batch);
    if (!r.is_ok()) return r;
    ++batch;

    for (const auto& p : pending) {
        r = RunUp(p, batch);
        if (!r.is_ok()) return r;

        const std::string name = p.migration->Name();
        LogDebug("Migrated %s (%s) in batch %d", name.c_str(), p.unit_path.c_str(), batch);
        Note("Migrated: " + name);
        applied.push_back(name);
    }
    return Result::Ok();
}

Result Migrator::Rollback(const std::vector<std::string>& unit_paths,
                          std::vector<std::string>& rolled_back,
                          std::vector<std::string>* dropped) {
    rolled_back.clear();
    if (dropped) dropped->clear();

    std::vector<LedgerEntry> entries;
    auto r = ledger_.Last(unit_paths, entries);
    if (!r.is_ok()) return r;

    if (entries.empty()) {
        Note("Nothing to rollback.");
        return Result::Ok();
    }

    for (const auto& entry : entries) {
        bool reversed = false;
        r = Reverse(entry, reversed);
        if (!r.is_ok()) return r;
        if (reversed) {
            rolled_back.push_back(entry.migration);
        } else if (dropped) {
            dropped->push_back(entry.migration);
        }
    }
    return Result::Ok();
}

Result Migrator::RollbackNamed(const std::string& unit_path,
                               const std::vector<std::string>& names,
                               std::vector<std::string>& rolled_back,
                               std::vector<std::string>* dropped) {
    rolled_back.clear();
    if (dropped) dropped->clear();

    std::vector<std::string> ran;
    auto r = ledger_.Ran(unit_path, ran);
    if (!r.is_ok()) return r;

    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        if (std::find(ran.begin(), ran.end(), *it) == ran.end()) {
            LogDebug("Not in ledger, skipping rollback of %s (%s)", it->c_str(), unit_path.c_str());
            continue;
        }

        LedgerEntry entry;
        entry.unit_path = unit_path;
        entry.migration = *it;

        bool reversed = false;
        r = Reverse(entry, reversed);
        if (!r.is_ok()) return r;
        if (reversed) {
            rolled_back.push_back(entry.migration);
        } else if (dropped) {
            dropped->push_back(entry.migration);
        }
    }
    return Result::Ok();
}

Result Migrator::Reverse(const LedgerEntry& entry, bool& reversed) {
    reversed = false;

    IMigration* m = catalog_.Find(entry.unit_path, entry.migration);
    if (!m) {
        LogWarn("Migration not found: %s (%s), dropping its ledger row",
                entry.migration.c_str(), entry.unit_path.c_str());
        Note("Migration not found: " + entry.migration);
        return ledger_.Delete(entry.unit_path, entry.migration);
    }

    auto r = RunDown(entry, *m);
    if (!r.is_ok()) return r;

    Note("Rolled back: " + entry.migration);
    reversed = true;
    return Result::Ok();
}

} // namespace sysupdate
