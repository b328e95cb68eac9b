#pragma once

#include "skillsref/common/result.hpp"
#include "skillsref/skills/error.hpp"
#include "skillsref/skills/skill.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace skillsref::skills {

struct PromptOptions {
  bool escape_location = true;
};

/// Escapes & < > " ' for inclusion in XML text.
[[nodiscard]] std::string html_escape(std::string_view text);

/// Render the <available_skills> block. No trailing newline.
[[nodiscard]] std::string to_prompt(const std::vector<SkillLocation> &skills,
                                    const PromptOptions &options = {});

/// Read a skill directory and pair its properties with the resolved path of
/// its SKILL.md.
[[nodiscard]] common::Result<SkillLocation, SkillError>
locate_skill(const std::filesystem::path &skill_dir);

/// Fails on the first directory that cannot be read.
[[nodiscard]] common::Result<std::string, SkillError>
to_prompt_for_dirs(const std::vector<std::filesystem::path> &skill_dirs,
                   const PromptOptions &options = {});

} // namespace skillsref::skills
