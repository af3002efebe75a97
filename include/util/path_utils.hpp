#pragma once

#include <string>
#include <string_view>

namespace adbpipe {

// Single-quote a word for POSIX sh; embedded quotes become '"'"'.
inline std::string ShellQuote(std::string_view s) {
    std::string out = "'";
    out.reserve(s.size() + 2);
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

// Leaves plain words (tool names, simple paths) readable in logged commands.
inline std::string ShellWord(std::string_view s) {
    constexpr std::string_view kSafe =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-./=:,+@%";
    if (!s.empty() && s.find_first_not_of(kSafe) == std::string_view::npos)
        return std::string(s);
    return ShellQuote(s);
}

inline std::string_view TrimWhitespace(std::string_view s) {
    constexpr std::string_view kWs = " \t\r\n\v\f";
    const auto first = s.find_first_not_of(kWs);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(kWs);
    return s.substr(first, last - first + 1);
}

// Join device-side paths; the device always uses '/'.
inline std::string JoinRemotePath(std::string_view base, std::string_view name) {
    std::string out(base);
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    std::string_view tail = name;
    while (!tail.empty() && tail.front() == '/') tail.remove_prefix(1);
    if (tail.empty()) return out;
    if (out.empty() || out.back() != '/') out.push_back('/');
    out.append(tail);
    return out;
}

inline bool IsSinglePathComponent(std::string_view s) {
    return !s.empty() && s != "." && s != ".." && s.find('/') == std::string_view::npos;
}

} // namespace adbpipe
