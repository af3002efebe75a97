#pragma once

#include "util/result.hpp"

namespace adbpipe {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    void Close();

    // Both ends are created close-on-exec.
    static Result Pipe(Fd& read_end, Fd& write_end);

  private:
    int fd_{-1};
};

} // namespace adbpipe
