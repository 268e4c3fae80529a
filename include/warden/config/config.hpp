#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Loads the config file if present, then applies WARDEN_* overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// Fails on unusable settings; returns warnings for suspicious ones.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace warden::config
