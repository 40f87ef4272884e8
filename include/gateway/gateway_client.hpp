#pragma once

#include "gateway/http_transport.hpp"
#include "store/parameter_store.hpp"
#include "store/unit_repository.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"
#include "util/update_config.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sysupdate {

struct GatewayOptions {
    std::string server_url;
    std::string changelog_url;
    std::string public_key_pem;
    std::optional<BasicAuth> auth;
    bool edge = false;
    std::string temp_dir;

    std::string app_url;
    std::string client_ip;
    std::string client_name;

    static GatewayOptions FromConfig(const UpdateConfig& cfg);
};

class GatewayClient {
public:
    static constexpr const char kProtocolVersion[] = "1.3";

    GatewayClient(GatewayOptions opts,
                  IHttpTransport& transport,
                  ParameterStore& params,
                  UnitRepository& units,
                  const IClock& clock);

    // Requests are signed only when both are non-empty.
    void SetSecurity(std::string key, std::string secret);

    /**
     * @brief POST to {server}/{endpoint} and return the verified JSON payload.
     *
     * 404 -> NotFound, other non-200 -> BadResponse (server body or a default
     * message), undecodable/empty body -> InvalidResponse, signature
     * mismatch -> BadSignature.
     */
    Result RequestData(const std::string& endpoint,
                       const nlohmann::ordered_json& extra,
                       nlohmann::ordered_json& out);

    /**
     * @brief POST to {server}/{endpoint}, streaming the body to FilePath(file_code).
     *
     * A 301/302 carrying a redirect URL is followed exactly once with an
     * unsigned GET into the same file. On a final non-200 the file's
     * contents become the error message. A non-empty expected_hash is
     * checked against the MD5 of the file.
     */
    Result RequestFile(const std::string& endpoint,
                       const std::string& file_code,
                       const std::string& expected_hash,
                       const nlohmann::ordered_json& extra);

    Result RequestChangelog(nlohmann::ordered_json& out);

    // {temp_dir}/{md5(file_code)}.arc
    std::string FilePath(const std::string& file_code) const;

    std::string CreateServerUrl(const std::string& endpoint) const;

private:
    Result BuildRequest(const std::string& endpoint,
                        const nlohmann::ordered_json& extra,
                        HttpRequest& out);
    Result ServerFingerprint(std::string& out);
    std::string CreateNonce() const;

    GatewayOptions opts_;
    IHttpTransport& transport_;
    ParameterStore& params_;
    UnitRepository& units_;
    const IClock& clock_;
    std::string key_;
    std::string secret_;
};

} // namespace sysupdate
