#pragma once

#include <filesystem>
#include <optional>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace osintpipe::config {

std::filesystem::path GetDefaultConfigPath();

// Reads the JSON file (explicit path, OSINTPIPE_CONFIG, or the default
// location), then applies OSINTPIPE_* environment overrides.
Config LoadConfig(const std::optional<std::filesystem::path>& path = std::nullopt);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

// Throws std::invalid_argument naming the first offending field.
void ValidateConfig(const Config& config);

}  // namespace osintpipe::config
