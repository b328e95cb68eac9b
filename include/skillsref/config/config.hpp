#pragma once

#include "skillsref/common/result.hpp"
#include "skillsref/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace skillsref::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
/// The explicit override only; SKILLSREF_CONFIG_PATH is not consulted.
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();

/// Warnings for values that load but will be ignored or replaced by defaults.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

/// TOML rendering of the effective configuration.
[[nodiscard]] std::string render_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace skillsref::config
