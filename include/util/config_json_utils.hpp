#pragma once

#include "util/transfer_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace adbpipe::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, TransferConfig& cfg, std::string& err);

} // namespace adbpipe::config::detail
