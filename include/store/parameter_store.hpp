#pragma once

#include "store/database.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace sysupdate {

namespace params {
inline constexpr const char kCoreBuild[] = "system::core.build";
inline constexpr const char kCoreHash[] = "system::core.hash";
inline constexpr const char kCoreModified[] = "system::core.modified";
inline constexpr const char kUpdateCount[] = "system::update.count";
inline constexpr const char kUpdateRetry[] = "system::update.retry";
inline constexpr const char kProjectId[] = "system::project.id";
inline constexpr const char kThemeHistory[] = "cms::theme.history";
} // namespace params

// Durable key/value settings, each value stored as JSON text.
class ParameterStore {
public:
    explicit ParameterStore(Database& db) : db_(db) {}

    Result Init();

    Result Get(const std::string& key, std::optional<nlohmann::json>& out);
    Result GetString(const std::string& key, std::optional<std::string>& out);
    Result GetInt(const std::string& key, std::optional<std::int64_t>& out);

    Result Set(const std::string& key, const nlohmann::json& value);
    Result Forget(const std::string& key);

private:
    Database& db_;
};

} // namespace sysupdate
