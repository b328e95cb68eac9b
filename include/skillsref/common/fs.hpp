#pragma once

#include "skillsref/common/result.hpp"
#include <filesystem>
#include <string>

namespace skillsref::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Symlinks and relative segments resolved; falls back to the absolute path
/// when the target cannot be canonicalized.
[[nodiscard]] std::filesystem::path resolve_path(const std::filesystem::path &path);

} // namespace skillsref::common
