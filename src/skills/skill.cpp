#include "skillsref/skills/skill.hpp"

#include "skillsref/common/json_util.hpp"
#include "skillsref/skills/unicode.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace skillsref::skills {

SkillProperties::SkillProperties(std::string name, std::string description,
                                 SkillPropertyFields fields)
    : name_(std::move(name)), description_(std::move(description)), fields_(std::move(fields)) {}

common::Result<SkillProperties, SkillError>
SkillProperties::create(std::string name, std::string description, SkillPropertyFields fields) {
  using PropertiesResult = common::Result<SkillProperties, SkillError>;
  if (trim_whitespace(name).empty()) {
    return PropertiesResult::failure(
        ValidationError::single("Field 'name' must be a non-empty string"));
  }
  if (trim_whitespace(description).empty()) {
    return PropertiesResult::failure(
        ValidationError::single("Field 'description' must be a non-empty string"));
  }
  if (fields.metadata.has_value() && fields.metadata->empty()) {
    fields.metadata = std::nullopt;
  }
  return PropertiesResult::success(
      SkillProperties(std::move(name), std::move(description), std::move(fields)));
}

std::string properties_to_json(const SkillProperties &properties) {
  std::vector<std::pair<std::string, std::string>> entries;
  entries.emplace_back("name", common::json_quote(properties.name()));
  entries.emplace_back("description", common::json_quote(properties.description()));
  if (properties.license()) {
    entries.emplace_back("license", common::json_quote(*properties.license()));
  }
  if (properties.compatibility()) {
    entries.emplace_back("compatibility", common::json_quote(*properties.compatibility()));
  }
  if (properties.allowed_tools()) {
    entries.emplace_back("allowed-tools", common::json_quote(*properties.allowed_tools()));
  }
  if (properties.metadata()) {
    std::ostringstream metadata;
    metadata << "{\n";
    bool first = true;
    for (const auto &[key, value] : *properties.metadata()) {
      if (!first) {
        metadata << ",\n";
      }
      first = false;
      metadata << "    " << common::json_quote(key) << ": " << common::json_quote(value);
    }
    metadata << "\n  }";
    entries.emplace_back("metadata", metadata.str());
  }

  std::ostringstream out;
  out << "{\n";
  for (std::size_t i = 0; i < entries.size(); ++i) {
    out << "  " << common::json_quote(entries[i].first) << ": " << entries[i].second;
    out << (i + 1 < entries.size() ? ",\n" : "\n");
  }
  out << "}";
  return out.str();
}

} // namespace skillsref::skills
