#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace adbpipe {

class IDeviceBridge {
  public:
    virtual ~IDeviceBridge() = default;
    virtual bool DevicePresent() const = 0;
    // 0 on any failure; the cause is logged.
    virtual std::uint64_t RemoteSize(const std::string& remote_path) const = 0;
    virtual Result EnsureRemoteDir(const std::string& remote_path) const = 0;
};

// Talks to the device through the adb command line.
class AdbBridge final : public IDeviceBridge {
  public:
    explicit AdbBridge(std::string tool = "adb");

    bool DevicePresent() const override;
    std::uint64_t RemoteSize(const std::string& remote_path) const override;
    Result EnsureRemoteDir(const std::string& remote_path) const override;

    // Parses the first field of `du -s -b` output ("174598144\t/sdcard/Transfer").
    static bool ParseDuOutput(const std::string& text, std::uint64_t& out);

  private:
    std::vector<std::string> Shell(const std::string& remote_command) const;

    std::string tool_;
};

} // namespace adbpipe
