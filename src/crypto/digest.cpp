#include "crypto/digest.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <cstdint>
#include <fstream>
#include <vector>

namespace sysupdate {

namespace {

std::string HexEncode(const unsigned char* bytes, size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

class StreamingDigest {
public:
    explicit StreamingDigest(const EVP_MD* md) {
        ok_ = ctx_.ok() && EVP_DigestInit_ex(ctx_.get(), md, nullptr) == 1;
    }

    bool Update(const void* data, size_t len) {
        if (!ok_ || len == 0) return ok_;
        ok_ = EVP_DigestUpdate(ctx_.get(), data, len) == 1;
        return ok_;
    }

    std::string FinalHex() {
        if (!ok_) return {};
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1) return {};
        ok_ = false;
        return HexEncode(digest.data(), len);
    }

private:
    EvpCtx ctx_;
    bool ok_ = false;
};

std::string DigestHex(const EVP_MD* md, std::string_view data) {
    StreamingDigest digest(md);
    if (!digest.Update(data.data(), data.size())) return {};
    return digest.FinalHex();
}

} // namespace

std::string Md5Hex(std::string_view data) { return DigestHex(EVP_md5(), data); }

std::string Sha256Hex(std::string_view data) { return DigestHex(EVP_sha256(), data); }

Result Md5HexFile(const std::string& path, std::string& out_hex) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) return Result::Fail(ErrorCode::Io, "cannot open " + path);

    StreamingDigest digest(EVP_md5());
    std::vector<char> buf(64 * 1024);
    while (is) {
        is.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize n = is.gcount();
        if (n <= 0) break;
        if (!digest.Update(buf.data(), static_cast<size_t>(n))) {
            return Result::Fail(ErrorCode::Io, "md5 failed for " + path);
        }
    }
    if (is.bad()) return Result::Fail(ErrorCode::Io, "read failed: " + path);

    out_hex = digest.FinalHex();
    if (out_hex.empty()) return Result::Fail(ErrorCode::Io, "md5 failed for " + path);
    return Result::Ok();
}

std::string HmacSha512(std::string_view key, std::string_view data) {
    static const char kEmptyKey[] = "";
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int len = 0;
    const char* key_data = key.empty() ? kEmptyKey : key.data();
    const unsigned char* res = HMAC(EVP_sha512(),
                                    key_data, static_cast<int>(key.size()),
                                    reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                    mac.data(), &len);
    if (!res) return {};
    return std::string(reinterpret_cast<const char*>(mac.data()), len);
}

} // namespace sysupdate
