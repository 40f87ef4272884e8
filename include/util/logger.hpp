#pragma once

#include <cstdarg>
#include <optional>
#include <string>

namespace sysupdate {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error" and "none".
std::optional<LogLevel> ParseLogLevel(const std::string& name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::sysupdate::Logger::Instance().LogWithSource(::sysupdate::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::sysupdate::Logger::Instance().LogWithSource(::sysupdate::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::sysupdate::Logger::Instance().LogWithSource(::sysupdate::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::sysupdate::Logger::Instance().LogWithSource(::sysupdate::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace sysupdate
