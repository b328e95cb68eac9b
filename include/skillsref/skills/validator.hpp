#pragma once

#include "skillsref/skills/frontmatter.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillsref::skills {

inline constexpr std::size_t kMaxNameLength = 64;
inline constexpr std::size_t kMaxDescriptionLength = 1024;
inline constexpr std::size_t kMaxCompatibilityLength = 500;

/// Frontmatter keys a skill may declare, in sorted order.
inline constexpr std::string_view kAllowedFields[] = {
    "allowed-tools", "compatibility", "description", "license", "metadata", "name",
};

struct ValidationResult {
  std::vector<std::string> errors;

  [[nodiscard]] bool ok() const { return errors.empty(); }
  bool operator==(const ValidationResult &other) const = default;
};

[[nodiscard]] std::vector<std::string>
validate_name(const std::string &name,
              const std::optional<std::string> &directory_name = std::nullopt);
[[nodiscard]] std::vector<std::string> validate_description(const std::string &description);
[[nodiscard]] std::vector<std::string> validate_compatibility(const std::string &compatibility);

/// Check decoded frontmatter against every rule. When directory_name is set
/// the (normalized) name must equal it.
[[nodiscard]] ValidationResult
validate_metadata(const FrontmatterMapping &header,
                  const std::optional<std::string> &directory_name = std::nullopt);

/// Validate a skill directory. Never fails outright; problems with the path
/// itself are reported as entries in the result.
[[nodiscard]] ValidationResult validate(const std::filesystem::path &skill_dir);

} // namespace skillsref::skills
