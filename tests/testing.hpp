#pragma once

#include "crypto/base64.hpp"
#include "crypto/signature.hpp"
#include "gateway/http_transport.hpp"
#include "migration/migration.hpp"
#include "store/cache_store.hpp"
#include "store/database.hpp"
#include "store/migration_ledger.hpp"
#include "store/parameter_store.hpp"
#include "store/plugin_history.hpp"
#include "store/unit_repository.hpp"
#include "util/clock.hpp"
#include "util/notes_output.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/sysupdate_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        // Best-effort cleanup. Keep it simple: rely on "rm -rf".
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

inline void WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) throw std::runtime_error("cannot write " + path);
    os << contents;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    std::ostringstream ss;
    ss << is.rdbuf();
    return ss.str();
}

struct ArchiveItem {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
};

enum class ArchiveFormat { Tar, Zip };

inline std::string BuildArchive(const std::vector<ArchiveItem>& entries, ArchiveFormat format = ArchiveFormat::Zip) {
    std::vector<char> out(1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    const int fmt = format == ArchiveFormat::Zip ? archive_write_set_format_zip(a)
                                                 : archive_write_set_format_pax_restricted(a);
    if (fmt != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    return std::string(out.data(), used);
}

// RSA key standing in for the gateway's signing key.
class TestSigningKey {
  public:
    TestSigningKey() : key_(EVP_RSA_gen(2048)) {
        if (!key_) throw std::runtime_error("EVP_RSA_gen failed");
    }

    std::string PublicPem() const {
        std::unique_ptr<BIO, BioFree> bio(BIO_new(BIO_s_mem()));
        if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
            throw std::runtime_error("PEM_write_bio_PUBKEY failed");
        }
        char* data = nullptr;
        const long len = BIO_get_mem_data(bio.get(), &data);
        return std::string(data, static_cast<size_t>(len));
    }

    // What the gateway puts in the Rest-Sign header for `payload`.
    std::string Sign(const nlohmann::ordered_json& payload) const {
        const std::string content = sysupdate::SignatureCodec::SignedContent(payload);

        std::unique_ptr<EVP_MD_CTX, MdCtxFree> ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha1(), nullptr, key_.get()) != 1) {
            throw std::runtime_error("EVP_DigestSignInit failed");
        }
        size_t len = 0;
        if (EVP_DigestSign(ctx.get(), nullptr, &len,
                           reinterpret_cast<const unsigned char*>(content.data()), content.size()) != 1) {
            throw std::runtime_error("EVP_DigestSign failed");
        }
        std::string sig(len, '\0');
        if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(sig.data()), &len,
                           reinterpret_cast<const unsigned char*>(content.data()), content.size()) != 1) {
            throw std::runtime_error("EVP_DigestSign failed");
        }
        sig.resize(len);
        return sysupdate::Base64Encode(sig);
    }

  private:
    struct PkeyFree {
        void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); }
    };
    struct BioFree {
        void operator()(BIO* b) const { BIO_free(b); }
    };
    struct MdCtxFree {
        void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
    };

    std::unique_ptr<EVP_PKEY, PkeyFree> key_;
};

// Key generation is slow; tests share one key.
inline const TestSigningKey& SharedSigningKey() {
    static const TestSigningKey key;
    return key;
}

// Replays canned responses and records every request.
class FakeTransport final : public sysupdate::IHttpTransport {
  public:
    void Push(sysupdate::HttpResponse resp) { responses_.push_back(std::move(resp)); }

    void PushSigned(const TestSigningKey& key, const nlohmann::ordered_json& payload) {
        sysupdate::HttpResponse resp;
        resp.code = 200;
        resp.body = payload.dump();
        resp.headers["rest-sign"] = key.Sign(payload);
        Push(std::move(resp));
    }

    void PushStatus(long code, std::string body, std::string redirect_url = {}) {
        sysupdate::HttpResponse resp;
        resp.code = code;
        resp.body = std::move(body);
        resp.redirect_url = std::move(redirect_url);
        Push(std::move(resp));
    }

    void FailNext(std::string msg) { failures_.push_back(std::move(msg)); }

    sysupdate::Result Perform(const sysupdate::HttpRequest& req, sysupdate::HttpResponse& resp) override {
        requests.push_back(req);
        if (!failures_.empty()) {
            auto msg = std::move(failures_.front());
            failures_.pop_front();
            return sysupdate::Result::Fail(sysupdate::ErrorCode::Transport, msg);
        }
        if (responses_.empty()) {
            return sysupdate::Result::Fail(sysupdate::ErrorCode::Transport, "no canned response");
        }

        resp = std::move(responses_.front());
        responses_.pop_front();
        if (!req.output_path.empty()) {
            WriteFile(req.output_path, resp.body);
            resp.body.clear();
        }
        return sysupdate::Result::Ok();
    }

    size_t Pending() const { return responses_.size(); }

    std::vector<sysupdate::HttpRequest> requests;

  private:
    std::deque<sysupdate::HttpResponse> responses_;
    std::deque<std::string> failures_;
};

class FakeClock final : public sysupdate::IClock {
  public:
    explicit FakeClock(std::int64_t seconds = 1700000000) : micros_(seconds * 1000000) {}

    std::int64_t NowSeconds() const override { return micros_ / 1000000; }
    std::int64_t NowMicros() const override { return micros_; }

    void Advance(std::int64_t seconds) { micros_ += seconds * 1000000; }
    void SetMicros(std::int64_t micros) { micros_ = micros; }

  private:
    std::int64_t micros_;
};

class MemoryNotes final : public sysupdate::INotesOutput {
  public:
    void WriteLine(const std::string& line) override { lines.push_back(line); }

    bool Contains(const std::string& line) const {
        for (const auto& l : lines) {
            if (l == line) return true;
        }
        return false;
    }

    std::vector<std::string> lines;
};

// Code migration that creates and drops one table.
class TableMigration final : public sysupdate::IMigration {
  public:
    TableMigration(std::string name, std::string table, std::vector<std::string> notices = {})
        : name_(std::move(name)), table_(std::move(table)), notices_(std::move(notices)) {}

    std::string Name() const override { return name_; }

    sysupdate::Result Up(sysupdate::Database& db, std::vector<std::string>& notices) override {
        ++ups;
        if (fail_up) return sysupdate::Result::Fail(sysupdate::ErrorCode::Migration, name_ + " failed");
        notices.insert(notices.end(), notices_.begin(), notices_.end());
        return db.Exec("CREATE TABLE " + table_ + " (id INTEGER)");
    }

    sysupdate::Result Down(sysupdate::Database& db) override {
        ++downs;
        return db.Exec("DROP TABLE " + table_);
    }

    int ups = 0;
    int downs = 0;
    bool fail_up = false;

  private:
    std::string name_;
    std::string table_;
    std::vector<std::string> notices_;
};

// Decoded value of `key` in an x-www-form-urlencoded body; empty if absent.
inline std::string FormValue(const std::string& body, const std::string& key) {
    size_t pos = 0;
    while (pos <= body.size()) {
        size_t amp = body.find('&', pos);
        if (amp == std::string::npos) amp = body.size();
        const std::string pair = body.substr(pos, amp - pos);
        const size_t eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == key) {
            std::string out;
            const std::string enc = pair.substr(eq + 1);
            for (size_t i = 0; i < enc.size(); ++i) {
                if (enc[i] == '+') {
                    out.push_back(' ');
                } else if (enc[i] == '%' && i + 2 < enc.size()) {
                    out.push_back(static_cast<char>(std::stoi(enc.substr(i + 1, 2), nullptr, 16)));
                    i += 2;
                } else {
                    out.push_back(enc[i]);
                }
            }
            return out;
        }
        pos = amp + 1;
    }
    return {};
}

// Lays out plugins/<author>/<name>/updates with version.json and the given
// SQL files; returns the plugin directory.
inline std::string WritePlugin(const std::string& plugins_dir,
                               const std::string& rel_dir,
                               const std::string& version_json,
                               const std::map<std::string, std::string>& update_files = {}) {
    const std::string dir = plugins_dir + "/" + rel_dir;
    std::filesystem::create_directories(dir + "/updates");
    WriteFile(dir + "/updates/version.json", version_json);
    for (const auto& [name, contents] : update_files) WriteFile(dir + "/updates/" + name, contents);
    return dir;
}

// SQLite-backed stores in a scratch directory.
struct TestStores {
    TemporaryDirectory dir;
    FakeClock clock;
    sysupdate::Database db;
    sysupdate::ParameterStore params{db};
    sysupdate::UnitRepository units{db};
    sysupdate::PluginHistory history{db};
    sysupdate::SqliteCacheStore cache{db, clock};
    sysupdate::MigrationLedger ledger{db, "migrations"};

    TestStores() {
        auto r = sysupdate::Database::Open(dir.Path() + "/test.sqlite", db);
        if (r.is_ok()) r = params.Init();
        if (r.is_ok()) r = units.Init();
        if (r.is_ok()) r = history.Init();
        if (r.is_ok()) r = cache.Init();
        if (!r.is_ok()) throw std::runtime_error(r.msg);
    }

    void AddUnit(const std::string& code, const std::string& version, bool frozen = false, bool updatable = true) {
        sysupdate::InstalledUnit u;
        u.code = code;
        u.name = code + " plugin";
        u.version = version;
        u.icon = "icon-" + code;
        u.is_frozen = frozen;
        u.is_updatable = updatable;
        u.created_at = "2023-01-01 00:00:00";
        auto r = units.Save(u);
        if (!r.is_ok()) throw std::runtime_error(r.msg);
    }
};

} // namespace testutil
