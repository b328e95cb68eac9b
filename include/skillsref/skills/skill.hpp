#pragma once

#include "skillsref/common/result.hpp"
#include "skillsref/skills/error.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace skillsref::skills {

inline constexpr std::string_view kSkillFileName = "SKILL.md";
inline constexpr std::string_view kSkillFileNameLower = "skill.md";

struct SkillPropertyFields {
  std::optional<std::string> license;
  std::optional<std::string> compatibility;
  std::optional<std::string> allowed_tools;
  std::optional<std::map<std::string, std::string>> metadata;

  bool operator==(const SkillPropertyFields &other) const = default;
};

/// Properties declared in a skill's frontmatter. Name and description are
/// never blank; create() refuses to build a record otherwise.
class SkillProperties {
public:
  [[nodiscard]] static common::Result<SkillProperties, SkillError>
  create(std::string name, std::string description, SkillPropertyFields fields = {});

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::string &description() const { return description_; }
  [[nodiscard]] const std::optional<std::string> &license() const { return fields_.license; }
  [[nodiscard]] const std::optional<std::string> &compatibility() const {
    return fields_.compatibility;
  }
  [[nodiscard]] const std::optional<std::string> &allowed_tools() const {
    return fields_.allowed_tools;
  }
  [[nodiscard]] const std::optional<std::map<std::string, std::string>> &metadata() const {
    return fields_.metadata;
  }

  bool operator==(const SkillProperties &other) const = default;

private:
  SkillProperties(std::string name, std::string description, SkillPropertyFields fields);

  std::string name_;
  std::string description_;
  SkillPropertyFields fields_;
};

struct SkillLocation {
  SkillProperties properties;
  std::filesystem::path location;
};

/// Pretty-printed JSON (two-space indent). Absent optional fields are omitted.
[[nodiscard]] std::string properties_to_json(const SkillProperties &properties);

} // namespace skillsref::skills
