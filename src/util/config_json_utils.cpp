#include "util/config_json_utils.hpp"

#include <chrono>
#include <fstream>

namespace adbpipe::config::detail {

namespace {

// Returns false only when the key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, bool& present,
                     std::string& err) {
    present = false;
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string("'") + key + "' must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    present = true;
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, TransferConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "bridge_tool", cfg.bridge_tool, err) ||
        !GetStringIfPresent(j, "metering_tool", cfg.metering_tool, err) ||
        !GetStringIfPresent(j, "archiver_tool", cfg.archiver_tool, err) ||
        !GetStringIfPresent(j, "remote_base_dir", cfg.remote_base_dir, err) ||
        !GetStringIfPresent(j, "remote_target_dir", cfg.remote_target_dir, err) ||
        !GetStringIfPresent(j, "device_staging_dir", cfg.device_staging_dir, err)) {
        return false;
    }

    {
        std::uint64_t v{};
        bool present = false;
        if (!GetU64IfPresent(j, "sampling_interval_ms", v, present, err))
            return false;
        if (present)
            cfg.sampling_interval = std::chrono::milliseconds(v);
    }
    {
        std::uint64_t v{};
        bool present = false;
        if (!GetU64IfPresent(j, "max_diagnostic_lines", v, present, err))
            return false;
        if (present)
            cfg.max_diagnostic_lines = static_cast<std::size_t>(v);
    }
    {
        std::string level;
        if (!GetStringIfPresent(j, "log_level", level, err))
            return false;
        if (!level.empty() && !ParseLogLevel(level, cfg.log_level)) {
            err = "unknown log_level: " + level;
            return false;
        }
    }

    return true;
}

} // namespace adbpipe::config::detail
