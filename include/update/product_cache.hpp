#pragma once

#include "gateway/gateway_client.hpp"
#include "store/cache_store.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sysupdate {

enum class ProductType { Plugin, Theme };

// "plugin" / "theme"
const char* ToString(ProductType type);

/**
 * @brief Marketplace details per product code, with negative caching.
 *
 * Each type's map is one cache entry that lives two days. Codes the
 * gateway did not know are remembered as unknown so they are not asked
 * for again. The popular list is cached separately for an hour.
 */
class ProductDetailCache {
  public:
    static constexpr std::int64_t kDetailTtlSeconds = 2 * 24 * 3600;
    static constexpr std::int64_t kPopularTtlSeconds = 60 * 60;

    ProductDetailCache(GatewayClient& gateway, ICacheStore& cache, const IClock& clock)
        : gateway_(gateway), cache_(cache), clock_(clock) {}

    static std::string DetailsKey(ProductType type);
    static std::string PopularKey(ProductType type);

    Result Load(ProductType type);
    Result Save(ProductType type);

    // Known details for `codes`; unknown codes are left out.
    Result Lookup(ProductType type,
                  const std::vector<std::string>& codes,
                  std::vector<nlohmann::ordered_json>& out);

    Result Popular(ProductType type, nlohmann::ordered_json& out);

  private:
    Result EnsureLoaded(ProductType type);
    void CacheDetail(ProductType type, const std::string& code, nlohmann::ordered_json detail);

    GatewayClient& gateway_;
    ICacheStore& cache_;
    const IClock& clock_;
    std::map<ProductType, nlohmann::ordered_json> details_;
};

} // namespace sysupdate
