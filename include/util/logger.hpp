#pragma once

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace batchsync {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view s);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Mirror every record into an append-mode file in addition to stderr.
    // An empty path closes the file sink.
    bool SetLogFile(const std::string& path);

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
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

#define LogDebug(...) ::batchsync::Logger::Instance().LogWithSource(::batchsync::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::batchsync::Logger::Instance().LogWithSource(::batchsync::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::batchsync::Logger::Instance().LogWithSource(::batchsync::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::batchsync::Logger::Instance().LogWithSource(::batchsync::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace batchsync
