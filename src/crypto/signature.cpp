#include "crypto/signature.hpp"

#include "crypto/base64.hpp"
#include "crypto/canonical_json.hpp"
#include "crypto/digest.hpp"
#include "crypto/query_string.hpp"
#include "util/logger.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <memory>

namespace sysupdate {

namespace {

struct BioDeleter {
    void operator()(BIO* b) const {
        if (b) BIO_free(b);
    }
};

struct PkeyDeleter {
    void operator()(EVP_PKEY* k) const {
        if (k) EVP_PKEY_free(k);
    }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const {
        if (c) EVP_MD_CTX_free(c);
    }
};

std::unique_ptr<EVP_PKEY, PkeyDeleter> LoadPublicKey(const std::string& pem) {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return nullptr;
    return std::unique_ptr<EVP_PKEY, PkeyDeleter>(
        PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
}

} // namespace

std::string SignatureCodec::Sign(const nlohmann::ordered_json& payload, const std::string& secret) {
    const auto key = Base64Decode(secret);
    if (!key) {
        LogWarn("API secret is not valid base64, signing with raw secret");
    }
    const std::string mac = HmacSha512(key ? *key : secret, BuildQueryString(payload));
    return Base64Encode(mac);
}

std::string SignatureCodec::SignedContent(const nlohmann::ordered_json& payload) {
    return Base64Encode(CanonicalJson(payload));
}

bool SignatureCodec::Verify(const nlohmann::ordered_json& payload,
                            const std::string& signature,
                            const std::string& public_key_pem) {
    if (signature.empty()) return false;

    const auto raw_sig = Base64Decode(signature);
    if (!raw_sig || raw_sig->empty()) return false;

    auto pkey = LoadPublicKey(public_key_pem);
    if (!pkey) {
        LogError("Gateway public key could not be parsed");
        return false;
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) return false;
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha1(), nullptr, pkey.get()) != 1) {
        return false;
    }

    const std::string content = SignedContent(payload);
    const int rc = EVP_DigestVerify(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(raw_sig->data()),
                                    raw_sig->size(),
                                    reinterpret_cast<const unsigned char*>(content.data()),
                                    content.size());
    return rc == 1;
}

} // namespace sysupdate
