#include <gtest/gtest.h>

#include "update/product_cache.hpp"
#include "testing.hpp"

namespace sysupdate {

class ProductDetailCacheTest : public ::testing::Test {
  protected:
    ProductDetailCacheTest()
        : gateway_(MakeOptions(), transport_, stores_.params, stores_.units, stores_.clock),
          products_(gateway_, stores_.cache, stores_.clock) {}

    GatewayOptions MakeOptions() {
        GatewayOptions o;
        o.server_url = "https://gateway.test/api";
        o.public_key_pem = key_.PublicPem();
        o.temp_dir = stores_.dir.Path() + "/temp";
        return o;
    }

    static nlohmann::ordered_json Product(const std::string& code) {
        return {{"code", code}, {"name", code + " name"}};
    }

    const testutil::TestSigningKey& key_ = testutil::SharedSigningKey();
    testutil::TestStores stores_;
    testutil::FakeTransport transport_;
    GatewayClient gateway_;
    ProductDetailCache products_;
};

TEST_F(ProductDetailCacheTest, KeysArePerType) {
    EXPECT_EQ(ProductDetailCache::DetailsKey(ProductType::Plugin), "system-updates-product-details-plugin");
    EXPECT_EQ(ProductDetailCache::DetailsKey(ProductType::Theme), "system-updates-product-details-theme");
    EXPECT_EQ(ProductDetailCache::PopularKey(ProductType::Theme), "system-updates-popular-theme");
}

TEST_F(ProductDetailCacheTest, LookupRequestsOnlyNewCodes) {
    transport_.PushSigned(key_, nlohmann::ordered_json::array({Product("Acme.Blog")}));

    std::vector<nlohmann::ordered_json> out;
    auto r = products_.Lookup(ProductType::Plugin, {"Acme.Blog", "Acme.Ghost", "Acme.Blog"}, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["name"], "Acme.Blog name");

    ASSERT_EQ(transport_.requests.size(), 1u);
    const auto& req = transport_.requests[0];
    EXPECT_EQ(req.url, "https://gateway.test/api/plugin/details");
    EXPECT_EQ(testutil::FormValue(req.body, "names%5B0%5D"), "Acme.Blog");
    EXPECT_EQ(testutil::FormValue(req.body, "names%5B1%5D"), "Acme.Ghost");
    EXPECT_TRUE(testutil::FormValue(req.body, "names%5B2%5D").empty());

    // The unknown code is remembered, so no second request goes out.
    ASSERT_TRUE(products_.Lookup(ProductType::Plugin, {"Acme.Ghost", "Acme.Blog"}, out).is_ok());
    EXPECT_EQ(transport_.requests.size(), 1u);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["code"], "Acme.Blog");
}

TEST_F(ProductDetailCacheTest, CacheExpiresAfterTwoDays) {
    transport_.PushSigned(key_, nlohmann::ordered_json::array({Product("Acme.Blog")}));
    std::vector<nlohmann::ordered_json> out;
    ASSERT_TRUE(products_.Lookup(ProductType::Plugin, {"Acme.Blog"}, out).is_ok());

    stores_.clock.Advance(ProductDetailCache::kDetailTtlSeconds + 1);
    transport_.PushSigned(key_, nlohmann::ordered_json::array({Product("Acme.Blog")}));
    ASSERT_TRUE(products_.Lookup(ProductType::Plugin, {"Acme.Blog"}, out).is_ok());
    EXPECT_EQ(transport_.requests.size(), 2u);
}

TEST_F(ProductDetailCacheTest, TypesDoNotShareEntries) {
    transport_.PushSigned(key_, nlohmann::ordered_json::array({Product("Acme.Demo")}));
    std::vector<nlohmann::ordered_json> out;
    ASSERT_TRUE(products_.Lookup(ProductType::Theme, {"Acme.Demo"}, out).is_ok());
    EXPECT_EQ(transport_.requests[0].url, "https://gateway.test/api/theme/details");

    transport_.PushSigned(key_, nlohmann::ordered_json::array());
    ASSERT_TRUE(products_.Lookup(ProductType::Plugin, {"Acme.Demo"}, out).is_ok());
    EXPECT_EQ(transport_.requests.size(), 2u);
    EXPECT_TRUE(out.empty());
}

TEST_F(ProductDetailCacheTest, GatewayFailureIsReported) {
    transport_.PushStatus(500, "");
    std::vector<nlohmann::ordered_json> out;
    auto r = products_.Lookup(ProductType::Plugin, {"Acme.Blog"}, out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.code(), ErrorCode::BadResponse);
}

TEST_F(ProductDetailCacheTest, PopularIsCachedForAnHourAndFeedsDetails) {
    auto popular = nlohmann::ordered_json::array({Product("Acme.Blog"), Product("Acme.Forum")});
    transport_.PushSigned(key_, popular);

    nlohmann::ordered_json out;
    ASSERT_TRUE(products_.Popular(ProductType::Plugin, out).is_ok());
    EXPECT_EQ(out, popular);
    EXPECT_EQ(transport_.requests[0].url, "https://gateway.test/api/plugin/popular");

    ASSERT_TRUE(products_.Popular(ProductType::Plugin, out).is_ok());
    EXPECT_EQ(transport_.requests.size(), 1u);

    std::vector<nlohmann::ordered_json> details;
    ASSERT_TRUE(products_.Lookup(ProductType::Plugin, {"Acme.Forum"}, details).is_ok());
    EXPECT_EQ(transport_.requests.size(), 1u);
    ASSERT_EQ(details.size(), 1u);

    stores_.clock.Advance(ProductDetailCache::kPopularTtlSeconds + 1);
    transport_.PushSigned(key_, popular);
    ASSERT_TRUE(products_.Popular(ProductType::Plugin, out).is_ok());
    EXPECT_EQ(transport_.requests.size(), 2u);
}

} // namespace sysupdate
