#include <gtest/gtest.h>

#include "crypto/base64.hpp"
#include "crypto/digest.hpp"
#include "crypto/signature.hpp"
#include "testing.hpp"

namespace sysupdate {

TEST(SignatureCodecTest, SignIsHmacSha512OfQueryString) {
    nlohmann::ordered_json payload;
    payload["protocol_version"] = "1.3";
    payload["client"] = "sysupdate";

    // base64("secret-key")
    const std::string secret = "c2VjcmV0LWtleQ==";
    EXPECT_EQ(SignatureCodec::Sign(payload, secret),
              "hM/CtJyN+EMW8+/Te3JXcVn5N857Pp07DENRgIYOzht4ITOSqYgJJeAHkwuGWU+sQ/vpqzBDBAwQt2hoFbDnEg==");
}

TEST(SignatureCodecTest, SignCoversNestedParameters) {
    nlohmann::ordered_json payload;
    payload["names"] = {"Acme.Blog", "Foo.Bar"};
    payload["force"] = false;

    EXPECT_EQ(SignatureCodec::Sign(payload, "c2VjcmV0LWtleQ=="),
              "rj+Y7GN+LWkEeyWhs98RKBn6RMWfFxVeZTwZAcr/OLxTkqBNCzCtDGmabQvezo0qmbCP9KmmxlnEXOxUfSpGXA==");
}

TEST(SignatureCodecTest, SignedContentIsBase64CanonicalJson) {
    nlohmann::ordered_json payload;
    payload["a"] = "x/y";
    EXPECT_EQ(SignatureCodec::SignedContent(payload), "eyJhIjoieFwveSJ9");
}

TEST(SignatureCodecTest, VerifiesGatewaySignature) {
    const auto& key = testutil::SharedSigningKey();
    nlohmann::ordered_json payload;
    payload["update"] = 2;
    payload["plugins"] = {{"Acme.Blog", {{"version", "1.0.2"}, {"hash", "abc"}}}};

    EXPECT_TRUE(SignatureCodec::Verify(payload, key.Sign(payload), key.PublicPem()));
}

TEST(SignatureCodecTest, RejectsTamperedPayload) {
    const auto& key = testutil::SharedSigningKey();
    nlohmann::ordered_json payload;
    payload["update"] = 2;
    const std::string sig = key.Sign(payload);

    payload["update"] = 3;
    EXPECT_FALSE(SignatureCodec::Verify(payload, sig, key.PublicPem()));
}

TEST(SignatureCodecTest, RejectsEmptyOrMalformedInput) {
    const auto& key = testutil::SharedSigningKey();
    nlohmann::ordered_json payload;
    payload["update"] = 0;

    EXPECT_FALSE(SignatureCodec::Verify(payload, "", key.PublicPem()));
    EXPECT_FALSE(SignatureCodec::Verify(payload, "!!not base64!!", key.PublicPem()));
    EXPECT_FALSE(SignatureCodec::Verify(payload, key.Sign(payload), "not a pem"));
}

TEST(DigestTest, Md5MatchesKnownValues) {
    EXPECT_EQ(Md5Hex("NULL"), "6c3e226b4d4795d518ab341b0824ec29");
    EXPECT_EQ(Md5Hex("core"), "a74ad8dfacd4f985eb3977517615ce25");
}

TEST(Base64Test, RoundTripsBinaryAndToleratesWhitespace) {
    const std::string raw("\x00\xff\x10 abc", 7);
    const std::string enc = Base64Encode(raw);
    auto dec = Base64Decode(enc.substr(0, 4) + "\n" + enc.substr(4));
    ASSERT_TRUE(dec.has_value());
    EXPECT_EQ(*dec, raw);
    EXPECT_FALSE(Base64Decode("ab$d").has_value());
}

} // namespace sysupdate
