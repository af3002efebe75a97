#pragma once

#include <cstdarg>
#include <string>
#include <string_view>

namespace adbpipe {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
bool ParseLogLevel(std::string_view text, LogLevel& out);

// Process-wide stderr logger. Each record is formatted first and written
// with a single call, so lines from the reader thread and the interactive
// loop never interleave.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;
    bool Enabled(LogLevel lvl) const;

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

    // In-place "\r..." line sharing stderr with log records. A record
    // printed while it is active first terminates it.
    void WriteStatusLine(const std::string& text);
    void EndStatusLine();
    bool StatusLineActive() const;

private:
    Logger() = default;
};

#define LogDebug(...) ::adbpipe::Logger::Instance().LogWithSource(::adbpipe::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::adbpipe::Logger::Instance().LogWithSource(::adbpipe::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::adbpipe::Logger::Instance().LogWithSource(::adbpipe::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::adbpipe::Logger::Instance().LogWithSource(::adbpipe::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace adbpipe
