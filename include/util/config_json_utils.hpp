#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace isoboot::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, Config& cfg, std::string& err);

} // namespace isoboot::config::detail
