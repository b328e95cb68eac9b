#include "skillsref/skills/prompt.hpp"

#include "skillsref/common/fs.hpp"
#include "skillsref/observability/global.hpp"
#include "skillsref/skills/loader.hpp"

#include <sstream>

namespace skillsref::skills {

std::string html_escape(const std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#x27;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::string to_prompt(const std::vector<SkillLocation> &skills, const PromptOptions &options) {
  std::ostringstream out;
  out << "<available_skills>";
  for (const auto &skill : skills) {
    const std::string location = skill.location.string();
    out << "\n<skill>";
    out << "\n<name>\n" << html_escape(skill.properties.name()) << "\n</name>";
    out << "\n<description>\n" << html_escape(skill.properties.description()) << "\n</description>";
    out << "\n<location>\n"
        << (options.escape_location ? html_escape(location) : location) << "\n</location>";
    out << "\n</skill>";
  }
  out << "\n</available_skills>";
  observability::record_prompt_render(skills.size());
  return out.str();
}

common::Result<SkillLocation, SkillError> locate_skill(const std::filesystem::path &skill_dir) {
  using LocationResult = common::Result<SkillLocation, SkillError>;
  const std::filesystem::path resolved = common::resolve_path(skill_dir);

  auto properties = read_properties(resolved);
  if (!properties.ok()) {
    return LocationResult::failure(properties.error());
  }
  const auto skill_md = find_skill_md(resolved);
  if (!skill_md.has_value()) {
    return LocationResult::failure(ParseError{"SKILL.md not found in " + resolved.string()});
  }
  return LocationResult::success(SkillLocation{std::move(properties.value()), *skill_md});
}

common::Result<std::string, SkillError>
to_prompt_for_dirs(const std::vector<std::filesystem::path> &skill_dirs,
                   const PromptOptions &options) {
  using PromptResult = common::Result<std::string, SkillError>;
  std::vector<SkillLocation> skills;
  skills.reserve(skill_dirs.size());
  for (const auto &dir : skill_dirs) {
    auto located = locate_skill(dir);
    if (!located.ok()) {
      return PromptResult::failure(located.error());
    }
    skills.push_back(std::move(located.value()));
  }
  return PromptResult::success(to_prompt(skills, options));
}

} // namespace skillsref::skills
