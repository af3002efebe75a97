#include "device/device_bridge.hpp"

#include "io/command_runner.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <charconv>
#include <string_view>
#include <utility>

namespace adbpipe {

AdbBridge::AdbBridge(std::string tool) : tool_(std::move(tool)) {}

std::vector<std::string> AdbBridge::Shell(const std::string& remote_command) const {
    return {tool_, "shell", remote_command};
}

bool AdbBridge::DevicePresent() const {
    LogDebug("Checking for device via %s get-state", tool_.c_str());

    CommandOutput out;
    auto r = RunCommand({tool_, "get-state"}, out);
    if (!r.is_ok()) {
        LogError("Device check failed: %s", r.message().c_str());
        return false;
    }
    if (out.exit_code != 0) {
        const std::string detail(TrimWhitespace(out.err));
        LogError("Device connection failed: %s", detail.c_str());
        return false;
    }
    return true;
}

bool AdbBridge::ParseDuOutput(const std::string& text, std::uint64_t& out) {
    const std::string_view trimmed = TrimWhitespace(text);
    if (trimmed.empty())
        return false;

    const auto end = trimmed.find_first_of(" \t");
    const std::string_view field = trimmed.substr(0, end);
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc() || ptr != field.data() + field.size())
        return false;
    out = value;
    return true;
}

std::uint64_t AdbBridge::RemoteSize(const std::string& remote_path) const {
    LogDebug("Calculating remote size for %s", remote_path.c_str());

    CommandOutput out;
    auto r = RunCommand(Shell("du -s -b " + ShellQuote(remote_path)), out);
    if (!r.is_ok()) {
        LogError("Error calculating remote size: %s", r.message().c_str());
        return 0;
    }
    if (out.exit_code != 0) {
        const std::string detail(TrimWhitespace(out.err.empty() ? out.out : out.err));
        LogError("Failed to get remote size of %s: %s", remote_path.c_str(), detail.c_str());
        return 0;
    }

    std::uint64_t size = 0;
    if (!ParseDuOutput(out.out, size)) {
        const std::string detail(TrimWhitespace(out.out));
        LogError("Unexpected du output for %s: '%s'", remote_path.c_str(), detail.c_str());
        return 0;
    }
    LogInfo("Remote size: %llu bytes", static_cast<unsigned long long>(size));
    return size;
}

Result AdbBridge::EnsureRemoteDir(const std::string& remote_path) const {
    CommandOutput out;
    auto r = RunCommand(Shell("mkdir -p " + ShellQuote(remote_path)), out);
    if (!r.is_ok())
        return r;
    if (out.exit_code != 0) {
        const std::string detail(TrimWhitespace(out.err.empty() ? out.out : out.err));
        return Result::Fail(kErrIo, "mkdir -p " + remote_path + " failed: " + detail);
    }
    return Result::Ok();
}

} // namespace adbpipe
