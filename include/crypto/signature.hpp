#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace sysupdate {

class SignatureCodec {
public:
    // Base64(HMAC-SHA512(query string of payload, Base64-decoded secret)).
    static std::string Sign(const nlohmann::ordered_json& payload, const std::string& secret);

    // Verifies a Base64 RSA/SHA-1 signature made over
    // Base64(CanonicalJson(payload)) against a PEM public key. Never throws;
    // an empty or malformed signature or key yields false.
    static bool Verify(const nlohmann::ordered_json& payload,
                       const std::string& signature,
                       const std::string& public_key_pem);

    // The exact bytes the gateway signs for a given payload.
    static std::string SignedContent(const nlohmann::ordered_json& payload);
};

} // namespace sysupdate
