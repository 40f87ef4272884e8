#include "update/product_cache.hpp"

#include "util/logger.hpp"

#include <set>

namespace sysupdate {

namespace {

// Stored for codes the gateway did not return.
constexpr int kUnknownProduct = -1;

bool IsUnknown(const nlohmann::ordered_json& j) {
    return j.is_number_integer() && j.get<int>() == kUnknownProduct;
}

} // namespace

const char* ToString(ProductType type) {
    return type == ProductType::Theme ? "theme" : "plugin";
}

std::string ProductDetailCache::DetailsKey(ProductType type) {
    return std::string("system-updates-product-details-") + ToString(type);
}

std::string ProductDetailCache::PopularKey(ProductType type) {
    return std::string("system-updates-popular-") + ToString(type);
}

Result ProductDetailCache::Load(ProductType type) {
    std::optional<std::string> stored;
    auto r = cache_.Get(DetailsKey(type), stored);
    if (!r.is_ok()) return r;

    auto map = nlohmann::ordered_json::object();
    if (stored) {
        auto parsed = nlohmann::ordered_json::parse(*stored, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            map = std::move(parsed);
        } else {
            LogWarn("Discarding malformed %s cache entry", DetailsKey(type).c_str());
        }
    }
    details_[type] = std::move(map);
    return Result::Ok();
}

Result ProductDetailCache::Save(ProductType type) {
    auto r = EnsureLoaded(type);
    if (!r.is_ok()) return r;
    return cache_.Put(DetailsKey(type), details_[type].dump(), clock_.NowSeconds() + kDetailTtlSeconds);
}

Result ProductDetailCache::EnsureLoaded(ProductType type) {
    if (details_.count(type)) return Result::Ok();
    return Load(type);
}

void ProductDetailCache::CacheDetail(ProductType type, const std::string& code, nlohmann::ordered_json detail) {
    details_[type][code] = std::move(detail);
}

Result ProductDetailCache::Lookup(ProductType type,
                                  const std::vector<std::string>& codes,
                                  std::vector<nlohmann::ordered_json>& out) {
    out.clear();

    auto r = Load(type);
    if (!r.is_ok()) return r;

    std::vector<std::string> requested;
    std::set<std::string> seen;
    for (const auto& code : codes) {
        if (seen.insert(code).second) requested.push_back(code);
    }

    auto& map = details_[type];
    std::vector<std::string> new_codes;
    for (const auto& code : requested) {
        if (!map.contains(code)) new_codes.push_back(code);
    }

    if (!new_codes.empty()) {
        nlohmann::ordered_json extra;
        extra["names"] = new_codes;

        nlohmann::ordered_json data;
        r = gateway_.RequestData(std::string(ToString(type)) + "/details", extra, data);
        if (!r.is_ok()) return r;

        std::set<std::string> returned;
        for (const auto& product : data) {
            if (!product.is_object()) continue;
            auto it = product.find("code");
            if (it == product.end() || !it->is_string()) {
                LogWarn("Skipping %s detail without a code", ToString(type));
                continue;
            }
            const std::string code = it->get<std::string>();
            CacheDetail(type, code, product);
            returned.insert(code);
        }

        for (const auto& code : new_codes) {
            if (!returned.count(code)) {
                LogDebug("Caching unknown %s %s", ToString(type), code.c_str());
                CacheDetail(type, code, kUnknownProduct);
            }
        }

        r = Save(type);
        if (!r.is_ok()) return r;
    }

    for (const auto& code : requested) {
        auto it = map.find(code);
        if (it == map.end() || IsUnknown(*it)) continue;
        out.push_back(*it);
    }
    return Result::Ok();
}

Result ProductDetailCache::Popular(ProductType type, nlohmann::ordered_json& out) {
    const std::string key = PopularKey(type);

    std::optional<std::string> stored;
    auto r = cache_.Get(key, stored);
    if (!r.is_ok()) return r;

    if (stored) {
        auto parsed = nlohmann::ordered_json::parse(*stored, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded()) {
            out = std::move(parsed);
            return Result::Ok();
        }
        LogWarn("Discarding malformed %s cache entry", key.c_str());
    }

    nlohmann::ordered_json data;
    r = gateway_.RequestData(std::string(ToString(type)) + "/popular", nlohmann::ordered_json::object(), data);
    if (!r.is_ok()) return r;

    r = cache_.Put(key, data.dump(), clock_.NowSeconds() + kPopularTtlSeconds);
    if (!r.is_ok()) return r;

    r = EnsureLoaded(type);
    if (!r.is_ok()) return r;

    for (const auto& product : data) {
        if (!product.is_object()) continue;
        auto it = product.find("code");
        if (it == product.end() || !it->is_string()) continue;
        CacheDetail(type, it->get<std::string>(), product);
    }

    r = Save(type);
    if (!r.is_ok()) return r;

    out = std::move(data);
    return Result::Ok();
}

} // namespace sysupdate
