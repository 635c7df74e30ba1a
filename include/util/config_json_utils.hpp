#pragma once

#include "util/run_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace batchsync::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, RunConfig& cfg, std::string& err);

} // namespace batchsync::config::detail
