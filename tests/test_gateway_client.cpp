#include <gtest/gtest.h>

#include "crypto/base64.hpp"
#include "crypto/digest.hpp"
#include "gateway/gateway_client.hpp"
#include "testing.hpp"

#include <filesystem>

namespace sysupdate {

class GatewayClientTest : public ::testing::Test {
  protected:
    GatewayClientTest() : gateway_(MakeOptions(), transport_, stores_.params, stores_.units, stores_.clock) {}

    GatewayOptions MakeOptions() {
        GatewayOptions o;
        o.server_url = "https://gateway.test/api";
        o.changelog_url = "https://gateway.test/changelog?json";
        o.public_key_pem = testutil::SharedSigningKey().PublicPem();
        o.temp_dir = stores_.dir.Path() + "/temp";
        o.app_url = "http://site.test/";
        o.client_ip = "10.0.0.1";
        o.client_name = "sysupdate";
        return o;
    }

    const testutil::TestSigningKey& key_ = testutil::SharedSigningKey();
    testutil::TestStores stores_;
    testutil::FakeTransport transport_;
    GatewayClient gateway_;
};

TEST_F(GatewayClientTest, PostsProtocolFields) {
    nlohmann::ordered_json payload = {{"update", 0}};
    transport_.PushSigned(key_, payload);

    nlohmann::ordered_json extra;
    extra["name"] = "Acme.Blog";
    nlohmann::ordered_json out;
    auto r = gateway_.RequestData("plugin/detail", extra, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out, payload);

    ASSERT_EQ(transport_.requests.size(), 1u);
    const auto& req = transport_.requests[0];
    EXPECT_EQ(req.method, HttpRequest::Method::Post);
    EXPECT_EQ(req.url, "https://gateway.test/api/plugin/detail");
    EXPECT_FALSE(req.follow_redirects);
    EXPECT_EQ(req.body.rfind("name=Acme.Blog&protocol_version=1.3&client=sysupdate&server=", 0), 0u);
    EXPECT_TRUE(testutil::FormValue(req.body, "nonce").empty());
    EXPECT_TRUE(req.headers.empty());
    EXPECT_FALSE(req.basic_auth.has_value());
}

TEST_F(GatewayClientTest, ServerFingerprintCarriesOldestInstall) {
    stores_.AddUnit("Acme.Blog", "1.0.0");
    transport_.PushSigned(key_, {{"ok", true}});

    nlohmann::ordered_json out;
    ASSERT_TRUE(gateway_.RequestData("core/update", nlohmann::ordered_json::object(), out).is_ok());

    auto decoded = Base64Decode(testutil::FormValue(transport_.requests[0].body, "server"));
    ASSERT_TRUE(decoded.has_value());
    auto server = nlohmann::ordered_json::parse(*decoded);
    EXPECT_EQ(server["url"], "http://site.test/");
    EXPECT_EQ(server["ip"], "10.0.0.1");
    EXPECT_EQ(server["since"], "2023-01-01 00:00:00");
    EXPECT_TRUE(server.contains("runtime"));
}

TEST_F(GatewayClientTest, AddsProjectEdgeAndSignatureWhenConfigured) {
    ASSERT_TRUE(stores_.params.Set(params::kProjectId, "proj-1").is_ok());
    auto opts = MakeOptions();
    opts.edge = true;
    opts.auth = BasicAuth{"alice", "secret"};
    GatewayClient gateway(opts, transport_, stores_.params, stores_.units, stores_.clock);
    gateway.SetSecurity("api-key", "c2VjcmV0LWtleQ==");
    stores_.clock.SetMicros(1700000000123456);

    transport_.PushSigned(key_, {{"ok", true}});
    nlohmann::ordered_json out;
    ASSERT_TRUE(gateway.RequestData("project/detail", nlohmann::ordered_json::object(), out).is_ok());

    const auto& req = transport_.requests[0];
    EXPECT_EQ(testutil::FormValue(req.body, "project"), "proj-1");
    EXPECT_EQ(testutil::FormValue(req.body, "edge"), "1");
    EXPECT_EQ(testutil::FormValue(req.body, "nonce"), "1700000000123456");
    ASSERT_EQ(req.headers.size(), 2u);
    EXPECT_EQ(req.headers[0].first, "Rest-Key");
    EXPECT_EQ(req.headers[0].second, "api-key");
    EXPECT_EQ(req.headers[1].first, "Rest-Sign");
    EXPECT_FALSE(req.headers[1].second.empty());
    ASSERT_TRUE(req.basic_auth.has_value());
    EXPECT_EQ(req.basic_auth->first, "alice");
}

TEST_F(GatewayClientTest, MapsHttpFailures) {
    nlohmann::ordered_json out;

    transport_.PushStatus(404, "missing");
    auto r = gateway_.RequestData("x", {}, out);
    EXPECT_EQ(r.code(), ErrorCode::NotFound);

    transport_.PushStatus(500, "Server exploded");
    r = gateway_.RequestData("x", {}, out);
    EXPECT_EQ(r.code(), ErrorCode::BadResponse);
    EXPECT_EQ(r.msg, "Server exploded");

    transport_.PushStatus(503, "");
    r = gateway_.RequestData("x", {}, out);
    EXPECT_EQ(r.code(), ErrorCode::BadResponse);
    EXPECT_EQ(r.msg, "Empty response from the server.");

    transport_.PushStatus(200, "<html>");
    r = gateway_.RequestData("x", {}, out);
    EXPECT_EQ(r.code(), ErrorCode::InvalidResponse);

    transport_.PushStatus(200, "null");
    r = gateway_.RequestData("x", {}, out);
    EXPECT_EQ(r.code(), ErrorCode::InvalidResponse);

    transport_.FailNext("connection refused");
    r = gateway_.RequestData("x", {}, out);
    EXPECT_EQ(r.code(), ErrorCode::Transport);
}

TEST_F(GatewayClientTest, RejectsUnsignedOrForgedResponses) {
    nlohmann::ordered_json out;

    transport_.PushStatus(200, R"({"update": 1})");
    auto r = gateway_.RequestData("core/update", {}, out);
    EXPECT_EQ(r.code(), ErrorCode::BadSignature);
    EXPECT_EQ(r.msg, "Invalid response from the server. (Bad signature)");

    HttpResponse forged;
    forged.code = 200;
    forged.body = R"({"update": 5})";
    forged.headers["rest-sign"] = key_.Sign({{"update", 1}});
    transport_.Push(forged);
    r = gateway_.RequestData("core/update", {}, out);
    EXPECT_EQ(r.code(), ErrorCode::BadSignature);
    EXPECT_TRUE(out.is_null());
}

TEST_F(GatewayClientTest, FilePathIsMd5OfCode) {
    EXPECT_EQ(gateway_.FilePath("core"), stores_.dir.Path() + "/temp/" + Md5Hex("core") + ".arc");
}

TEST_F(GatewayClientTest, DownloadsAndVerifiesHash) {
    const std::string body = "archive bytes";
    transport_.PushStatus(200, body);

    nlohmann::ordered_json extra;
    extra["name"] = "Acme.Blog";
    auto r = gateway_.RequestFile("plugin/get", "Acme.Blogh1", Md5Hex(body), extra);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFile(gateway_.FilePath("Acme.Blogh1")), body);
    EXPECT_EQ(transport_.requests[0].output_path, gateway_.FilePath("Acme.Blogh1"));
}

TEST_F(GatewayClientTest, DetectsCorruptDownload) {
    transport_.PushStatus(200, "truncated");
    auto r = gateway_.RequestFile("core/get", "core", Md5Hex("complete"), {});
    EXPECT_EQ(r.code(), ErrorCode::FileCorrupt);
}

TEST_F(GatewayClientTest, FollowsOneRedirectWithUnsignedGet) {
    gateway_.SetSecurity("api-key", "c2VjcmV0LWtleQ==");
    transport_.PushStatus(302, "", "https://cdn.test/core.zip");
    transport_.PushStatus(200, "zip");

    auto r = gateway_.RequestFile("core/get", "core", "", {{"type", "update"}});
    ASSERT_TRUE(r.is_ok()) << r.msg;

    ASSERT_EQ(transport_.requests.size(), 2u);
    const auto& follow = transport_.requests[1];
    EXPECT_EQ(follow.method, HttpRequest::Method::Get);
    EXPECT_EQ(follow.url, "https://cdn.test/core.zip");
    EXPECT_TRUE(follow.headers.empty());
    EXPECT_EQ(follow.output_path, gateway_.FilePath("core"));
    EXPECT_EQ(testutil::ReadFile(gateway_.FilePath("core")), "zip");
}

TEST_F(GatewayClientTest, RedirectIsFollowedOnlyOnce) {
    transport_.PushStatus(301, "", "https://cdn.test/a");
    transport_.PushStatus(302, "moved again", "https://cdn.test/b");

    auto r = gateway_.RequestFile("core/get", "core", "", {});
    EXPECT_EQ(r.code(), ErrorCode::BadResponse);
    EXPECT_EQ(r.msg, "moved again");
    EXPECT_EQ(transport_.requests.size(), 2u);
}

TEST_F(GatewayClientTest, ErrorBodyOfFailedDownloadBecomesMessage) {
    transport_.PushStatus(403, "License expired");
    auto r = gateway_.RequestFile("plugin/get", "Acme.Blogh1", "", {});
    EXPECT_EQ(r.code(), ErrorCode::BadResponse);
    EXPECT_EQ(r.msg, "License expired");
}

TEST_F(GatewayClientTest, ChangelogIsUnsignedGet) {
    transport_.PushStatus(200, R"([{"build": 100}])");
    nlohmann::ordered_json out;
    auto r = gateway_.RequestChangelog(out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out[0]["build"], 100);
    EXPECT_EQ(transport_.requests[0].method, HttpRequest::Method::Get);
    EXPECT_EQ(transport_.requests[0].url, "https://gateway.test/changelog?json");

    transport_.PushStatus(404, "");
    EXPECT_EQ(gateway_.RequestChangelog(out).code(), ErrorCode::NotFound);
}

} // namespace sysupdate
