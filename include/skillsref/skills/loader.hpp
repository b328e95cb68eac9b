#pragma once

#include "skillsref/common/result.hpp"
#include "skillsref/skills/error.hpp"
#include "skillsref/skills/frontmatter.hpp"
#include "skillsref/skills/skill.hpp"

#include <filesystem>
#include <optional>

namespace skillsref::skills {

/// SKILL.md is preferred over skill.md when both exist.
[[nodiscard]] std::optional<std::filesystem::path>
find_skill_md(const std::filesystem::path &skill_dir);

/// Build a properties record from decoded frontmatter. Missing or blank
/// name/description are validation errors.
[[nodiscard]] common::Result<SkillProperties, SkillError>
properties_from_frontmatter(const FrontmatterMapping &header);

/// Locate, read and parse a skill directory's SKILL.md. Only the required
/// fields are checked; use validate() for the full rule set.
[[nodiscard]] common::Result<SkillProperties, SkillError>
read_properties(const std::filesystem::path &skill_dir);

} // namespace skillsref::skills
