#pragma once
#include <string>
#include <utility>

namespace adbpipe {

inline constexpr int kErrValidation = 22;
inline constexpr int kErrBusy = 16;
inline constexpr int kErrLaunch = 127;
inline constexpr int kErrConfig = 78;
inline constexpr int kErrIo = 5;

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace adbpipe
