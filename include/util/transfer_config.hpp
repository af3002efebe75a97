#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace adbpipe {

inline constexpr const char* kDefaultConfigPath = "/etc/adbpipe/adbpipe.json";
inline constexpr const char* kConfigPathEnv = "ADBPIPE_CONFIG_PATH";

// Settings shared by every transfer attempt. The remote directory constants
// form the on-device contract: Pull archives remote_base_dir/remote_target_dir,
// Push extracts into device_staging_dir.
struct TransferConfig {
    std::string bridge_tool = "adb";
    std::string metering_tool = "pv";
    std::string archiver_tool = "tar";

    std::string remote_base_dir = "/sdcard";
    std::string remote_target_dir = "Transfer";
    std::string device_staging_dir = "/sdcard/Transfer";

    std::chrono::milliseconds sampling_interval{500};
    std::size_t max_diagnostic_lines = 1000;
    LogLevel log_level = LogLevel::Info;

    std::string RemoteSourcePath() const;
    Result Validate() const;

    static Result LoadFromFile(const std::string& path, TransferConfig& out);
};

} // namespace adbpipe
