#pragma once

#include "store/database.hpp"
#include "util/clock.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sysupdate {

class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    // Expired entries read as missing.
    virtual Result Get(const std::string& key, std::optional<std::string>& out) = 0;
    virtual Result Put(const std::string& key, const std::string& value, std::int64_t expires_at) = 0;
    virtual Result Forget(const std::string& key) = 0;
    virtual Result Flush() = 0;
};

class SqliteCacheStore final : public ICacheStore {
public:
    SqliteCacheStore(Database& db, const IClock& clock) : db_(db), clock_(clock) {}

    Result Init();

    Result Get(const std::string& key, std::optional<std::string>& out) override;
    Result Put(const std::string& key, const std::string& value, std::int64_t expires_at) override;
    Result Forget(const std::string& key) override;
    Result Flush() override;

private:
    Database& db_;
    const IClock& clock_;
};

} // namespace sysupdate
