#include "store/parameter_store.hpp"

#include <charconv>

namespace sysupdate {

Result ParameterStore::Init() {
    return db_.Exec("CREATE TABLE IF NOT EXISTS system_parameters ("
                    " item TEXT PRIMARY KEY,"
                    " value TEXT NOT NULL)");
}

Result ParameterStore::Get(const std::string& key, std::optional<nlohmann::json>& out) {
    out.reset();
    Statement stmt;
    auto r = db_.Prepare("SELECT value FROM system_parameters WHERE item = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, key); !r.is_ok()) return r;

    bool has_row = false;
    if (r = stmt.Step(has_row); !r.is_ok()) return r;
    if (!has_row) return Result::Ok();

    const std::string text = stmt.ColumnText(0);
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Result::Fail(ErrorCode::Database, "corrupt parameter value for " + key);
    }
    out = std::move(parsed);
    return Result::Ok();
}

Result ParameterStore::GetString(const std::string& key, std::optional<std::string>& out) {
    out.reset();
    std::optional<nlohmann::json> value;
    auto r = Get(key, value);
    if (!r.is_ok() || !value || value->is_null()) return r;

    if (value->is_string()) {
        out = value->get<std::string>();
    } else {
        out = value->dump();
    }
    return Result::Ok();
}

Result ParameterStore::GetInt(const std::string& key, std::optional<std::int64_t>& out) {
    out.reset();
    std::optional<nlohmann::json> value;
    auto r = Get(key, value);
    if (!r.is_ok() || !value) return r;

    if (value->is_number_integer()) {
        out = value->get<std::int64_t>();
    } else if (value->is_number_float()) {
        out = static_cast<std::int64_t>(value->get<double>());
    } else if (value->is_boolean()) {
        out = value->get<bool>() ? 1 : 0;
    } else if (value->is_string()) {
        const std::string s = value->get<std::string>();
        std::int64_t v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec == std::errc() && ptr == s.data() + s.size()) out = v;
    }
    return Result::Ok();
}

Result ParameterStore::Set(const std::string& key, const nlohmann::json& value) {
    Statement stmt;
    auto r = db_.Prepare("INSERT INTO system_parameters (item, value) VALUES (?, ?)"
                         " ON CONFLICT(item) DO UPDATE SET value = excluded.value",
                         stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, key); !r.is_ok()) return r;
    if (r = stmt.Bind(2, value.dump()); !r.is_ok()) return r;
    return stmt.Run();
}

Result ParameterStore::Forget(const std::string& key) {
    Statement stmt;
    auto r = db_.Prepare("DELETE FROM system_parameters WHERE item = ?", stmt);
    if (!r.is_ok()) return r;
    if (r = stmt.Bind(1, key); !r.is_ok()) return r;
    return stmt.Run();
}

} // namespace sysupdate
