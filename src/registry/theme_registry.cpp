#include "registry/theme_registry.hpp"

#include "util/logger.hpp"

namespace sysupdate {

Result ThemeRegistry::Load(nlohmann::json& history) {
    std::optional<nlohmann::json> stored;
    auto r = params_.Get(params::kThemeHistory, stored);
    if (!r.is_ok()) return r;

    if (stored && stored->is_object()) {
        history = std::move(*stored);
    } else {
        if (stored && !stored->is_null()) {
            LogWarn("Ignoring malformed %s parameter", params::kThemeHistory);
        }
        history = nlohmann::json::object();
    }
    return Result::Ok();
}

Result ThemeRegistry::IsInstalled(const std::string& code, bool& installed) {
    nlohmann::json history;
    auto r = Load(history);
    if (!r.is_ok()) return r;
    installed = history.contains(code);
    return Result::Ok();
}

Result ThemeRegistry::SetInstalled(const std::string& code, const std::string& dir_name) {
    nlohmann::json history;
    auto r = Load(history);
    if (!r.is_ok()) return r;
    history[code] = dir_name;
    return params_.Set(params::kThemeHistory, history);
}

Result ThemeRegistry::Installed(std::vector<std::string>& codes) {
    codes.clear();
    nlohmann::json history;
    auto r = Load(history);
    if (!r.is_ok()) return r;
    for (auto it = history.begin(); it != history.end(); ++it) codes.push_back(it.key());
    return Result::Ok();
}

} // namespace sysupdate
