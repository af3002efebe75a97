#include "util/transfer_config.hpp"

#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

namespace adbpipe {

std::string TransferConfig::RemoteSourcePath() const {
    return JoinRemotePath(remote_base_dir, remote_target_dir);
}

Result TransferConfig::Validate() const {
    if (bridge_tool.empty())
        return Result::Fail(kErrConfig, "bridge_tool must not be empty");
    if (metering_tool.empty())
        return Result::Fail(kErrConfig, "metering_tool must not be empty");
    if (archiver_tool.empty())
        return Result::Fail(kErrConfig, "archiver_tool must not be empty");
    if (remote_base_dir.empty() || remote_base_dir.front() != '/')
        return Result::Fail(kErrConfig, "remote_base_dir must be an absolute path");
    if (!IsSinglePathComponent(remote_target_dir))
        return Result::Fail(kErrConfig, "remote_target_dir must be a single directory name");
    if (device_staging_dir.empty() || device_staging_dir.front() != '/')
        return Result::Fail(kErrConfig, "device_staging_dir must be an absolute path");
    if (sampling_interval.count() <= 0)
        return Result::Fail(kErrConfig, "sampling_interval_ms must be positive");
    return Result::Ok();
}

Result TransferConfig::LoadFromFile(const std::string& path, TransferConfig& out) {
    out = TransferConfig{};

    nlohmann::json json;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(kErrConfig, err);
    }

    TransferConfig parsed;
    if (!config::detail::FillConfigFromJson(json, parsed, err)) {
        return Result::Fail(kErrConfig, err + " in " + path);
    }

    auto valid = parsed.Validate();
    if (!valid.is_ok()) {
        return Result::Fail(kErrConfig, valid.message() + " in " + path);
    }

    out = std::move(parsed);
    return Result::Ok();
}

} // namespace adbpipe
