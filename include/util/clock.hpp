#pragma once

#include <cstdint>
#include <string>

namespace sysupdate {

class IClock {
public:
    virtual ~IClock() = default;
    virtual std::int64_t NowSeconds() const = 0;
    virtual std::int64_t NowMicros() const = 0;
};

class SystemClock final : public IClock {
public:
    std::int64_t NowSeconds() const override;
    std::int64_t NowMicros() const override;
};

// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string FormatUtc(std::int64_t unix_seconds);

} // namespace sysupdate
