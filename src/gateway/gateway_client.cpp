#include "gateway/gateway_client.hpp"

#include "crypto/base64.hpp"
#include "crypto/canonical_json.hpp"
#include "crypto/digest.hpp"
#include "crypto/query_string.hpp"
#include "crypto/signature.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cinttypes>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sysupdate {

namespace {

constexpr const char kRuntimeVersion[] = "sysupdate/1.0";
constexpr const char kResponseNotFound[] = "The update server could not be found.";
constexpr const char kResponseEmpty[] = "Empty response from the server.";
constexpr const char kResponseInvalid[] = "Invalid response from the server.";

bool IsEmptyPayload(const nlohmann::ordered_json& j) {
    if (j.is_null()) return true;
    if (j.is_boolean() && !j.get<bool>()) return true;
    if (j.is_string() && j.get<std::string>().empty()) return true;
    return false;
}

Result ReadFileToString(const std::string& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) return Result::Fail(ErrorCode::Io, "cannot open " + path);
    std::ostringstream ss;
    ss << is.rdbuf();
    out = ss.str();
    return Result::Ok();
}

} // namespace

GatewayOptions GatewayOptions::FromConfig(const UpdateConfig& cfg) {
    GatewayOptions o;
    o.server_url = cfg.update_server;
    o.changelog_url = cfg.changelog_url;
    o.public_key_pem = cfg.gateway_public_key;
    o.auth = cfg.update_auth;
    o.edge = cfg.edge_updates;
    o.temp_dir = cfg.temp_dir;
    o.app_url = cfg.app_url;
    o.client_ip = cfg.client_ip;
    o.client_name = cfg.client_name;
    return o;
}

GatewayClient::GatewayClient(GatewayOptions opts,
                             IHttpTransport& transport,
                             ParameterStore& params,
                             UnitRepository& units,
                             const IClock& clock)
    : opts_(std::move(opts)), transport_(transport), params_(params), units_(units), clock_(clock) {}

void GatewayClient::SetSecurity(std::string key, std::string secret) {
    key_ = std::move(key);
    secret_ = std::move(secret);
}

std::string GatewayClient::CreateServerUrl(const std::string& endpoint) const {
    std::string url = opts_.server_url;
    if (url.empty() || url.back() != '/') url.push_back('/');
    return url + endpoint;
}

std::string GatewayClient::FilePath(const std::string& file_code) const {
    return opts_.temp_dir + "/" + Md5Hex(file_code) + ".arc";
}

std::string GatewayClient::CreateNonce() const {
    const std::int64_t micros = clock_.NowMicros();
    char buf[32]{};
    std::snprintf(buf, sizeof(buf), "%" PRId64 "%06" PRId64, micros / 1000000, micros % 1000000);
    return buf;
}

Result GatewayClient::ServerFingerprint(std::string& out) {
    std::optional<std::string> since;
    auto r = units_.OldestCreatedAt(since);
    if (!r.is_ok()) return r;

    nlohmann::ordered_json server;
    server["runtime"] = kRuntimeVersion;
    server["url"] = opts_.app_url;
    server["ip"] = opts_.client_ip;
    server["since"] = since ? nlohmann::ordered_json(*since) : nlohmann::ordered_json(nullptr);
    out = Base64Encode(CanonicalJson(server));
    return Result::Ok();
}

Result GatewayClient::BuildRequest(const std::string& endpoint,
                                   const nlohmann::ordered_json& extra,
                                   HttpRequest& out) {
    nlohmann::ordered_json post = extra.is_object() ? extra : nlohmann::ordered_json::object();
    post["protocol_version"] = kProtocolVersion;
    post["client"] = opts_.client_name;

    std::string server;
    auto r = ServerFingerprint(server);
    if (!r.is_ok()) return r;
    post["server"] = server;

    std::optional<std::string> project;
    r = params_.GetString(params::kProjectId, project);
    if (!r.is_ok()) return r;
    if (project && !project->empty()) {
        post["project"] = *project;
    }

    if (opts_.edge) {
        post["edge"] = 1;
    }

    out = HttpRequest{};
    out.method = HttpRequest::Method::Post;
    out.url = CreateServerUrl(endpoint);
    out.follow_redirects = false;

    if (!key_.empty() && !secret_.empty()) {
        post["nonce"] = CreateNonce();
        out.headers.emplace_back("Rest-Key", key_);
        out.headers.emplace_back("Rest-Sign", SignatureCodec::Sign(post, secret_));
    }

    if (opts_.auth) {
        out.basic_auth = std::make_pair(opts_.auth->user, opts_.auth->password);
    }

    out.body = BuildQueryString(post);
    return Result::Ok();
}

Result GatewayClient::RequestData(const std::string& endpoint,
                                  const nlohmann::ordered_json& extra,
                                  nlohmann::ordered_json& out) {
    HttpRequest req;
    auto r = BuildRequest(endpoint, extra, req);
    if (!r.is_ok()) return r;

    HttpResponse resp;
    r = transport_.Perform(req, resp);
    if (!r.is_ok()) return r;

    LogDebug("Gateway %s -> HTTP %ld", endpoint.c_str(), resp.code);

    if (resp.code == 404) {
        return Result::Fail(ErrorCode::NotFound, kResponseNotFound);
    }
    if (resp.code != 200) {
        return Result::Fail(ErrorCode::BadResponse, resp.body.empty() ? kResponseEmpty : resp.body);
    }

    auto decoded = nlohmann::ordered_json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (decoded.is_discarded() || IsEmptyPayload(decoded)) {
        return Result::Fail(ErrorCode::InvalidResponse, kResponseInvalid);
    }

    const std::string* signature = resp.Header("Rest-Sign");
    if (!SignatureCodec::Verify(decoded, signature ? *signature : std::string(), opts_.public_key_pem)) {
        LogError("Gateway response for %s failed signature verification", endpoint.c_str());
        return Result::Fail(ErrorCode::BadSignature, std::string(kResponseInvalid) + " (Bad signature)");
    }

    out = std::move(decoded);
    return Result::Ok();
}

Result GatewayClient::RequestFile(const std::string& endpoint,
                                  const std::string& file_code,
                                  const std::string& expected_hash,
                                  const nlohmann::ordered_json& extra) {
    std::error_code ec;
    std::filesystem::create_directories(opts_.temp_dir, ec);
    if (ec) {
        return Result::Fail(ErrorCode::Io, "cannot create " + opts_.temp_dir + ": " + ec.message());
    }

    const std::string file_path = FilePath(file_code);

    HttpRequest req;
    auto r = BuildRequest(endpoint, extra, req);
    if (!r.is_ok()) return r;
    req.output_path = file_path;

    HttpResponse resp;
    r = transport_.Perform(req, resp);
    if (!r.is_ok()) return r;

    if ((resp.code == 301 || resp.code == 302) && !resp.redirect_url.empty()) {
        LogInfo("Following download redirect for %s", file_code.c_str());
        HttpRequest follow;
        follow.method = HttpRequest::Method::Get;
        follow.url = resp.redirect_url;
        follow.follow_redirects = false;
        follow.output_path = file_path;

        r = transport_.Perform(follow, resp);
        if (!r.is_ok()) return r;
    }

    if (resp.code != 200) {
        std::string server_message;
        auto read = ReadFileToString(file_path, server_message);
        if (!read.is_ok()) return read;
        return Result::Fail(ErrorCode::BadResponse, server_message);
    }

    if (!expected_hash.empty()) {
        std::string actual;
        r = Md5HexFile(file_path, actual);
        if (!r.is_ok()) return r;
        if (ToLower(actual) != ToLower(expected_hash)) {
            return Result::Fail(ErrorCode::FileCorrupt,
                                "Downloaded file is corrupt: expected=" + expected_hash +
                                    " actual=" + actual);
        }
    }

    LogInfo("Downloaded %s to %s", file_code.c_str(), file_path.c_str());
    return Result::Ok();
}

Result GatewayClient::RequestChangelog(nlohmann::ordered_json& out) {
    HttpRequest req;
    req.method = HttpRequest::Method::Get;
    req.url = opts_.changelog_url;

    HttpResponse resp;
    auto r = transport_.Perform(req, resp);
    if (!r.is_ok()) return r;

    if (resp.code == 404) {
        return Result::Fail(ErrorCode::NotFound, kResponseEmpty);
    }
    if (resp.code != 200) {
        return Result::Fail(ErrorCode::BadResponse, resp.body.empty() ? kResponseEmpty : resp.body);
    }

    auto decoded = nlohmann::ordered_json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (decoded.is_discarded()) {
        return Result::Fail(ErrorCode::InvalidResponse, kResponseInvalid);
    }
    out = std::move(decoded);
    return Result::Ok();
}

} // namespace sysupdate
