#pragma once

#include "gateway/gateway_client.hpp"
#include "registry/theme_registry.hpp"
#include "store/parameter_store.hpp"
#include "store/unit_repository.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sysupdate {

struct UpdateOffer {
    std::string code;
    std::string name;
    std::string icon;
    std::string target_version;
    std::string target_hash;
    std::optional<std::string> old_version;
    nlohmann::ordered_json raw;
};

struct CoreOffer {
    std::string target_build;
    std::string target_hash;
    std::optional<std::string> old_build;
    nlohmann::ordered_json raw;
};

struct UpdateNegotiationResult {
    std::optional<CoreOffer> core;
    std::vector<UpdateOffer> plugins;
    std::vector<UpdateOffer> themes;
    int update_count = 0;
    bool has_updates = false;
};

// Works out how many updates are pending and which of them apply here.
class UpdateNegotiator {
  public:
    static constexpr std::int64_t kRetryIntervalSeconds = 24 * 3600;

    // `themes` may be null, in which case theme offers are not reported.
    UpdateNegotiator(GatewayClient& gateway,
                     ParameterStore& params,
                     UnitRepository& units,
                     ThemeRegistry* themes,
                     const IClock& clock,
                     bool disable_core_updates)
        : gateway_(gateway), params_(params), units_(units), themes_(themes), clock_(clock),
          disable_core_updates_(disable_core_updates) {}

    /**
     * @brief Cheap pending-update count.
     *
     * A remembered non-zero count is returned without asking the gateway;
     * otherwise the gateway is asked at most once per retry interval
     * unless `force` is set. Gateway failures count as zero updates.
     */
    Result Check(bool force, int& count);

    // Asks the gateway and filters its offers against local state.
    Result Negotiate(bool force, UpdateNegotiationResult& out);

    // Installed core hash, md5("NULL") until one is recorded.
    Result CoreHash(std::string& out);

  private:
    Result BuildRequest(bool force, std::vector<InstalledUnit>& installed, nlohmann::ordered_json& out);
    void Discount(int& count, const std::string& code) const;

    GatewayClient& gateway_;
    ParameterStore& params_;
    UnitRepository& units_;
    ThemeRegistry* themes_;
    const IClock& clock_;
    bool disable_core_updates_ = true;
};

} // namespace sysupdate
