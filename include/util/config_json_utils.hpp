#pragma once

#include "util/sync_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace luasync::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, SyncConfig& cfg, std::string& err);

} // namespace luasync::config::detail
