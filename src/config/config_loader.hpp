#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace selfrepair::config {

std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file (if present), then SELFREPAIR_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironmentOverrides(Config& config);

}  // namespace selfrepair::config
