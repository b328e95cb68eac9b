#include "skillsref/skills/loader.hpp"

#include "skillsref/common/fs.hpp"
#include "skillsref/observability/global.hpp"
#include "skillsref/skills/unicode.hpp"

#include <chrono>
#include <map>
#include <vector>

namespace skillsref::skills {

namespace {

using PropertiesResult = common::Result<SkillProperties, SkillError>;

/// Copies an optional scalar field. Null and collections read as absent.
std::optional<std::string> optional_scalar(const FrontmatterMapping &header,
                                           const std::string_view key) {
  const FrontmatterValue *value = find_value(header, key);
  if (value == nullptr || value->is_null() || !value->is_scalar()) {
    return std::nullopt;
  }
  return stringify(*value);
}

common::Result<std::string, SkillError> required_string(const FrontmatterMapping &header,
                                                        const std::string &key) {
  using FieldResult = common::Result<std::string, SkillError>;
  const FrontmatterValue *value = find_value(header, key);
  if (value == nullptr) {
    return FieldResult::failure(
        ValidationError::single("Missing required field in frontmatter: " + key));
  }
  const std::string *text = value->as_string();
  if (text == nullptr || trim_whitespace(*text).empty()) {
    return FieldResult::failure(
        ValidationError::single("Field '" + key + "' must be a non-empty string"));
  }
  return FieldResult::success(trim_whitespace(*text));
}

common::Result<std::optional<std::map<std::string, std::string>>, SkillError>
metadata_field(const FrontmatterMapping &header) {
  using MetadataResult =
      common::Result<std::optional<std::map<std::string, std::string>>, SkillError>;
  const FrontmatterValue *value = find_value(header, "metadata");
  if (value == nullptr || value->is_null()) {
    return MetadataResult::success(std::nullopt);
  }
  const FrontmatterMapping *mapping = value->as_mapping();
  if (mapping == nullptr) {
    return MetadataResult::failure(ValidationError::single("Field 'metadata' must be a mapping"));
  }
  if (mapping->empty()) {
    return MetadataResult::success(std::nullopt);
  }

  std::map<std::string, std::string> out;
  for (const auto &[key, entry] : *mapping) {
    out[key] = stringify(entry);
  }
  return MetadataResult::success(std::move(out));
}

} // namespace

std::optional<std::filesystem::path> find_skill_md(const std::filesystem::path &skill_dir) {
  for (const std::string_view name : {kSkillFileName, kSkillFileNameLower}) {
    const std::filesystem::path candidate = skill_dir / std::string(name);
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
  return std::nullopt;
}

PropertiesResult properties_from_frontmatter(const FrontmatterMapping &header) {
  // Both required keys are checked for presence before either value.
  std::vector<std::string> missing;
  for (const std::string key : {"name", "description"}) {
    if (!has_key(header, key)) {
      missing.push_back("Missing required field in frontmatter: " + key);
    }
  }
  if (!missing.empty()) {
    return PropertiesResult::failure(ValidationError::multiple(std::move(missing)));
  }

  auto name = required_string(header, "name");
  auto description = required_string(header, "description");
  if (!name.ok() || !description.ok()) {
    std::vector<std::string> errors;
    for (const auto *field : {&name, &description}) {
      if (!field->ok()) {
        const auto messages = error_messages(field->error());
        errors.insert(errors.end(), messages.begin(), messages.end());
      }
    }
    return PropertiesResult::failure(ValidationError::multiple(std::move(errors)));
  }

  auto metadata = metadata_field(header);
  if (!metadata.ok()) {
    return PropertiesResult::failure(metadata.error());
  }

  SkillPropertyFields fields;
  fields.license = optional_scalar(header, "license");
  fields.compatibility = optional_scalar(header, "compatibility");
  fields.allowed_tools = optional_scalar(header, "allowed-tools");
  fields.metadata = std::move(metadata.value());

  return SkillProperties::create(std::move(name.value()), std::move(description.value()),
                                 std::move(fields));
}

PropertiesResult read_properties(const std::filesystem::path &skill_dir) {
  const auto skill_md = find_skill_md(skill_dir);
  if (!skill_md.has_value()) {
    observability::record_skill_read(skill_dir.string(), false);
    return PropertiesResult::failure(ParseError{"SKILL.md not found in " + skill_dir.string()});
  }

  const auto started = std::chrono::steady_clock::now();
  const auto content = common::read_file(*skill_md);
  if (!content.ok()) {
    observability::record_skill_read(skill_md->string(), false);
    return PropertiesResult::failure(ParseError{content.error()});
  }

  const auto parsed = parse_frontmatter(content.value());
  observability::record_parse_latency(std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started));
  if (!parsed.ok()) {
    observability::record_skill_read(skill_md->string(), false);
    return PropertiesResult::failure(parsed.error());
  }

  auto properties = properties_from_frontmatter(parsed.value().header);
  observability::record_skill_read(skill_md->string(), properties.ok());
  return properties;
}

} // namespace skillsref::skills
