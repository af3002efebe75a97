#include "util/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace adbpipe {

namespace {
std::mutex g_mu;
std::atomic<LogLevel> g_level{LogLevel::Info};
// Guarded by g_mu.
bool g_status_active = false;

void TerminateStatusLineLocked() {
    if (g_status_active) {
        std::fputc('\n', stderr);
        g_status_active = false;
    }
}

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? (slash + 1) : file;
}
} // namespace

bool ParseLogLevel(std::string_view text, LogLevel& out) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") {
        out = LogLevel::Debug;
    } else if (lower == "info") {
        out = LogLevel::Info;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::Warn;
    } else if (lower == "error") {
        out = LogLevel::Error;
    } else if (lower == "none") {
        out = LogLevel::None;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    g_level.store(lvl);
}

LogLevel Logger::Level() const {
    return g_level.load();
}

bool Logger::Enabled(LogLevel lvl) const {
    return lvl != LogLevel::None && lvl >= g_level.load();
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    if (!Enabled(lvl)) return;

    std::string record;
    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    if (ts[0] != '\0') {
        record += "[";
        record += ts;
        record += "] ";
    }
    record += "[";
    record += ToStr(lvl);
    record += "] ";
    if (const char* base = BaseName(file); base && line > 0) {
        record += "[";
        record += base;
        record += ":" + std::to_string(line) + "] ";
    }

    va_list copy;
    va_copy(copy, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n > 0) {
        const size_t head = record.size();
        record.resize(head + static_cast<size_t>(n) + 1);
        std::vsnprintf(record.data() + head, static_cast<size_t>(n) + 1, fmt, ap);
        record.resize(head + static_cast<size_t>(n));
    }
    record.push_back('\n');

    std::lock_guard<std::mutex> lk(g_mu);
    TerminateStatusLineLocked();
    std::fputs(record.c_str(), stderr);
}

void Logger::WriteStatusLine(const std::string& text) {
    std::lock_guard<std::mutex> lk(g_mu);
    std::fputc('\r', stderr);
    std::fputs(text.c_str(), stderr);
    std::fflush(stderr);
    g_status_active = true;
}

void Logger::EndStatusLine() {
    std::lock_guard<std::mutex> lk(g_mu);
    TerminateStatusLineLocked();
}

bool Logger::StatusLineActive() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_status_active;
}

} // namespace adbpipe
