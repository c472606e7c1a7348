#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace runbox::config {

// ~/.runbox/config.json overlaid with environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

nlohmann::json ConfigToJson(const Config& config);

std::filesystem::path GetConfigPath();

}  // namespace runbox::config
