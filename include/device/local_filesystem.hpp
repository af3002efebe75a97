#pragma once

#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace adbpipe {

class ILocalFileSystem {
  public:
    virtual ~ILocalFileSystem() = default;
    virtual bool Exists(const std::string& path) const = 0;
    // Sum of regular file sizes below path; symlinks are not counted.
    // Returns 0 once cancel is set.
    virtual std::uint64_t LocalSize(const std::string& path, const std::atomic_bool& cancel) const = 0;
    virtual Result EnsureDir(const std::string& path) const = 0;
};

class PosixLocalFileSystem final : public ILocalFileSystem {
  public:
    bool Exists(const std::string& path) const override;
    std::uint64_t LocalSize(const std::string& path, const std::atomic_bool& cancel) const override;
    Result EnsureDir(const std::string& path) const override;
};

} // namespace adbpipe
