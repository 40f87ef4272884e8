#include "update/update_negotiator.hpp"

#include "crypto/base64.hpp"
#include "crypto/canonical_json.hpp"
#include "crypto/digest.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <charconv>

namespace sysupdate {

namespace {

// Gateway numbers may arrive as JSON numbers or numeric strings.
int ToInt(const nlohmann::ordered_json& j) {
    if (j.is_number_integer()) return j.get<int>();
    if (j.is_number_float()) return static_cast<int>(j.get<double>());
    if (j.is_boolean()) return j.get<bool>() ? 1 : 0;
    if (j.is_string()) {
        const auto s = j.get<std::string>();
        int v = 0;
        std::from_chars(s.data(), s.data() + s.size(), v);
        return v;
    }
    return 0;
}

std::string ToText(const nlohmann::ordered_json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_null()) return {};
    return j.dump();
}

std::string StringField(const nlohmann::ordered_json& obj, const char* key) {
    if (!obj.is_object()) return {};
    auto it = obj.find(key);
    return it == obj.end() ? std::string() : ToText(*it);
}

bool IsTruthy(const nlohmann::ordered_json& j) {
    if (j.is_null()) return false;
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_object() || j.is_array()) return !j.empty();
    if (j.is_string()) return !j.get<std::string>().empty();
    return true;
}

} // namespace

void UpdateNegotiator::Discount(int& count, const std::string& code) const {
    if (count <= 0) {
        LogWarn("Update count already zero while excluding %s; gateway count is inconsistent", code.c_str());
        count = 0;
        return;
    }
    --count;
}

Result UpdateNegotiator::CoreHash(std::string& out) {
    std::optional<std::string> hash;
    auto r = params_.GetString(params::kCoreHash, hash);
    if (!r.is_ok()) return r;
    out = (hash && !hash->empty()) ? *hash : Md5Hex("NULL");
    return Result::Ok();
}

Result UpdateNegotiator::BuildRequest(bool force,
                                      std::vector<InstalledUnit>& installed,
                                      nlohmann::ordered_json& out) {
    auto r = units_.All(installed);
    if (!r.is_ok()) return r;

    std::string hash;
    r = CoreHash(hash);
    if (!r.is_ok()) return r;

    // An empty map is encoded as a list, as the gateway expects.
    nlohmann::ordered_json versions =
        installed.empty() ? nlohmann::ordered_json::array() : nlohmann::ordered_json::object();
    for (const auto& unit : installed) versions[unit.code] = unit.version;

    std::vector<std::string> theme_codes;
    if (themes_) {
        r = themes_->Installed(theme_codes);
        if (!r.is_ok()) return r;
    }

    std::optional<nlohmann::json> build;
    r = params_.Get(params::kCoreBuild, build);
    if (!r.is_ok()) return r;

    out = nlohmann::ordered_json::object();
    out["core"] = hash;
    out["plugins"] = Base64Encode(CanonicalJson(versions));
    out["themes"] = Base64Encode(CanonicalJson(nlohmann::ordered_json(theme_codes)));
    out["build"] = build ? nlohmann::ordered_json::parse(build->dump()) : nlohmann::ordered_json(nullptr);
    out["force"] = force;
    return Result::Ok();
}

Result UpdateNegotiator::Negotiate(bool force, UpdateNegotiationResult& out) {
    out = UpdateNegotiationResult{};

    std::vector<InstalledUnit> installed;
    nlohmann::ordered_json request;
    auto r = BuildRequest(force, installed, request);
    if (!r.is_ok()) return r;

    nlohmann::ordered_json result;
    r = gateway_.RequestData("core/update", request, result);
    if (!r.is_ok()) return r;

    int count = result.is_object() && result.contains("update") ? ToInt(result["update"]) : 0;
    if (count < 0) {
        LogWarn("Gateway reported %d updates; counting none", count);
        count = 0;
    }

    if (result.is_object() && result.contains("core") && IsTruthy(result["core"])) {
        std::optional<std::string> old_build;
        std::optional<nlohmann::json> stored;
        r = params_.Get(params::kCoreBuild, stored);
        if (!r.is_ok()) return r;
        if (stored && !stored->is_null()) {
            old_build = stored->is_string() ? stored->get<std::string>() : stored->dump();
        }

        CoreOffer core;
        core.raw = result["core"];
        core.raw["old_build"] = old_build ? nlohmann::ordered_json(*old_build) : nlohmann::ordered_json(nullptr);
        core.target_build = StringField(core.raw, "build");
        core.target_hash = StringField(core.raw, "hash");
        core.old_build = old_build;

        if (disable_core_updates_) {
            LogInfo("Core update %s ignored, core updates are disabled", core.target_build.c_str());
            Discount(count, "core");
        } else {
            out.core = std::move(core);
        }
    }

    if (result.is_object() && result.contains("plugins") && result["plugins"].is_object()) {
        for (auto it = result["plugins"].begin(); it != result["plugins"].end(); ++it) {
            const std::string code = it.key();
            auto unit = std::find_if(installed.begin(), installed.end(),
                                     [&](const InstalledUnit& u) { return u.code == code; });

            UpdateOffer offer;
            offer.code = code;
            offer.raw = it.value();
            offer.target_version = StringField(offer.raw, "version");
            offer.target_hash = StringField(offer.raw, "hash");
            offer.name = unit != installed.end() && !unit->name.empty() ? unit->name : code;
            offer.icon = unit != installed.end() ? unit->icon : std::string();
            if (unit != installed.end()) offer.old_version = unit->version;

            if (offer.raw.is_object()) {
                offer.raw["name"] = offer.name;
                offer.raw["old_version"] =
                    offer.old_version ? nlohmann::ordered_json(*offer.old_version) : nlohmann::ordered_json(false);
                offer.raw["icon"] = offer.icon.empty() ? nlohmann::ordered_json(false) : nlohmann::ordered_json(offer.icon);
            }

            if (unit != installed.end() && (unit->is_frozen || !unit->is_updatable)) {
                LogInfo("Skipping update for %s (%s)", code.c_str(), unit->is_frozen ? "frozen" : "not updatable");
                Discount(count, code);
                continue;
            }
            out.plugins.push_back(std::move(offer));
        }
    }

    if (themes_ && result.is_object() && result.contains("themes") && result["themes"].is_object()) {
        for (auto it = result["themes"].begin(); it != result["themes"].end(); ++it) {
            bool is_installed = false;
            r = themes_->IsInstalled(it.key(), is_installed);
            if (!r.is_ok()) return r;
            if (is_installed) continue;

            UpdateOffer offer;
            offer.code = it.key();
            offer.name = it.key();
            offer.raw = it.value();
            offer.target_version = StringField(offer.raw, "version");
            offer.target_hash = StringField(offer.raw, "hash");
            out.themes.push_back(std::move(offer));
        }
    }

    count += static_cast<int>(out.themes.size());
    out.update_count = count;
    out.has_updates = count > 0;

    r = params_.Set(params::kUpdateCount, count);
    if (!r.is_ok()) return r;

    LogInfo("Gateway reports %d pending update(s)", count);
    return Result::Ok();
}

Result UpdateNegotiator::Check(bool force, int& count) {
    std::optional<std::int64_t> old_count;
    auto r = params_.GetInt(params::kUpdateCount, old_count);
    if (!r.is_ok()) return r;

    if (old_count && *old_count > 0) {
        count = static_cast<int>(*old_count);
        return Result::Ok();
    }

    if (!force) {
        std::optional<std::int64_t> retry;
        r = params_.GetInt(params::kUpdateRetry, retry);
        if (!r.is_ok()) return r;
        if (retry && *retry > clock_.NowSeconds()) {
            count = static_cast<int>(old_count.value_or(0));
            return Result::Ok();
        }
    }

    UpdateNegotiationResult result;
    auto negotiated = Negotiate(false, result);
    if (negotiated.is_ok()) {
        count = result.update_count;
    } else {
        LogWarn("Update check failed (%s): %s", ToString(negotiated.code()), negotiated.msg.c_str());
        count = 0;
    }

    r = params_.Set(params::kUpdateCount, count);
    if (!r.is_ok()) return r;
    return params_.Set(params::kUpdateRetry, clock_.NowSeconds() + kRetryIntervalSeconds);
}

} // namespace sysupdate
