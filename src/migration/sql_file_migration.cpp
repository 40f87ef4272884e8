#include "migration/sql_file_migration.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sysupdate {

namespace {

constexpr std::string_view kUpSuffix = ".up.sql";
constexpr std::string_view kDownSuffix = ".down.sql";
constexpr std::string_view kSqlSuffix = ".sql";

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

Result ReadScript(const std::string& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) return Result::Fail(ErrorCode::Io, "cannot open " + path);
    std::ostringstream ss;
    ss << is.rdbuf();
    out = ss.str();
    return Result::Ok();
}

} // namespace

Result SqlFileMigration::Up(Database& db, std::vector<std::string>& /*notices*/) {
    std::string sql;
    auto r = ReadScript(up_path_, sql);
    if (!r.is_ok()) return r;

    r = db.Exec(sql);
    if (!r.is_ok()) {
        return Result::Fail(ErrorCode::Migration, name_ + ": " + r.msg);
    }
    return Result::Ok();
}

Result SqlFileMigration::Down(Database& db) {
    std::error_code ec;
    if (down_path_.empty() || !std::filesystem::exists(down_path_, ec)) {
        LogWarn("No down script for %s", name_.c_str());
        return Result::Ok();
    }

    std::string sql;
    auto r = ReadScript(down_path_, sql);
    if (!r.is_ok()) return r;

    r = db.Exec(sql);
    if (!r.is_ok()) {
        return Result::Fail(ErrorCode::Migration, name_ + ": " + r.msg);
    }
    return Result::Ok();
}

Result SqlFileMigration::FromScript(const std::string& dir,
                                    const std::string& script,
                                    std::shared_ptr<IMigration>& out) {
    std::string name = script;
    if (EndsWith(name, kSqlSuffix)) name.resize(name.size() - kSqlSuffix.size());

    const std::filesystem::path base(dir);
    const std::string up = (base / (name + std::string(kUpSuffix))).string();
    const std::string down = (base / (name + std::string(kDownSuffix))).string();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(up, ec)) {
        return Result::Fail(ErrorCode::Migration, "Migration script not found: " + up);
    }

    out = std::make_shared<SqlFileMigration>(name, up, down);
    return Result::Ok();
}

Result DiscoverSqlMigrations(const std::string& dir, std::vector<std::shared_ptr<IMigration>>& out) {
    namespace fs = std::filesystem;
    out.clear();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return Result::Ok();

    std::vector<std::string> names;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string file = it->path().filename().string();
        if (!EndsWith(file, kUpSuffix)) continue;
        names.push_back(file.substr(0, file.size() - kUpSuffix.size()));
    }
    if (ec) {
        return Result::Fail(ErrorCode::Io, "cannot list " + dir + ": " + ec.message());
    }

    std::sort(names.begin(), names.end());
    for (const auto& name : names) {
        std::shared_ptr<IMigration> m;
        auto r = SqlFileMigration::FromScript(dir, name, m);
        if (!r.is_ok()) return r;
        out.push_back(std::move(m));
    }
    return Result::Ok();
}

} // namespace sysupdate
