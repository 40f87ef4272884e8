#pragma once

#include "migration/migration.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sysupdate {

// NAME.up.sql / NAME.down.sql pair. The down script is optional; without it
// rolling back only removes the ledger row.
class SqlFileMigration final : public IMigration {
  public:
    SqlFileMigration(std::string name, std::string up_path, std::string down_path)
        : name_(std::move(name)), up_path_(std::move(up_path)), down_path_(std::move(down_path)) {}

    std::string Name() const override { return name_; }
    Result Up(Database& db, std::vector<std::string>& notices) override;
    Result Down(Database& db) override;

    // Builds the migration for `script` ("create_posts.sql" or "create_posts")
    // found in `dir`. Fails when the up script is missing.
    static Result FromScript(const std::string& dir,
                             const std::string& script,
                             std::shared_ptr<IMigration>& out);

  private:
    std::string name_;
    std::string up_path_;
    std::string down_path_;
};

// Every *.up.sql file in `dir`, sorted by name. A missing directory yields
// an empty list.
Result DiscoverSqlMigrations(const std::string& dir, std::vector<std::shared_ptr<IMigration>>& out);

} // namespace sysupdate
