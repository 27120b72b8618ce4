#pragma once

#include "julesbot/common/result.hpp"
#include "julesbot/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace julesbot::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Parse a config document. Environment overrides are not applied.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Read the config file (a missing file yields defaults), load .env files and
/// apply environment overrides.
[[nodiscard]] common::Result<Config> load_config();

void apply_env_overrides(Config &config);

/// Fails with a Configuration error when the bot cannot run with this config;
/// otherwise returns non-fatal warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

} // namespace julesbot::config
