#include "skillsref/skills/validator.hpp"

#include "skillsref/common/fs.hpp"
#include "skillsref/observability/global.hpp"
#include "skillsref/skills/loader.hpp"
#include "skillsref/skills/unicode.hpp"

#include <algorithm>
#include <iterator>

namespace skillsref::skills {

namespace {

std::string normalized_or_raw(const std::string &value) {
  auto normalized = nfkc_normalize(value);
  return normalized.ok() ? normalized.value() : value;
}

std::string allowed_fields_list() {
  std::string out = "[";
  for (std::size_t i = 0; i < std::size(kAllowedFields); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += kAllowedFields[i];
  }
  return out + "]";
}

bool is_allowed_field(const std::string &key) {
  return std::find(std::begin(kAllowedFields), std::end(kAllowedFields), key) !=
         std::end(kAllowedFields);
}

std::vector<std::string> validate_allowed_fields(const FrontmatterMapping &header) {
  std::vector<std::string> unexpected;
  for (const auto &[key, value] : header) {
    (void)value;
    if (!is_allowed_field(key)) {
      unexpected.push_back(key);
    }
  }
  if (unexpected.empty()) {
    return {};
  }

  std::sort(unexpected.begin(), unexpected.end());
  std::string joined;
  for (std::size_t i = 0; i < unexpected.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += unexpected[i];
  }
  return {"Unexpected fields in frontmatter: " + joined + ". Only " + allowed_fields_list() +
          " are allowed."};
}

void append(std::vector<std::string> &into, std::vector<std::string> more) {
  into.insert(into.end(), std::make_move_iterator(more.begin()),
              std::make_move_iterator(more.end()));
}

std::optional<std::string> directory_name_of(const std::filesystem::path &skill_dir) {
  std::error_code ec;
  std::filesystem::path absolute = std::filesystem::absolute(skill_dir, ec);
  if (ec) {
    absolute = skill_dir;
  }
  absolute = absolute.lexically_normal();
  if (absolute.filename().empty()) {
    absolute = absolute.parent_path();
  }
  const std::string name = absolute.filename().string();
  if (name.empty()) {
    return std::nullopt;
  }
  return name;
}

ValidationResult finish(const std::filesystem::path &skill_dir, ValidationResult result) {
  observability::record_validation(skill_dir.string(), result.errors.size());
  return result;
}

} // namespace

std::vector<std::string> validate_name(const std::string &name,
                                       const std::optional<std::string> &directory_name) {
  const std::string trimmed = trim_whitespace(name);
  if (trimmed.empty()) {
    return {"Field 'name' must be a non-empty string"};
  }

  std::vector<std::string> errors;
  const std::string normalized = normalized_or_raw(trimmed);

  const std::size_t length = code_point_count(normalized);
  if (length > kMaxNameLength) {
    errors.push_back("Skill name '" + normalized + "' exceeds " + std::to_string(kMaxNameLength) +
                     " character limit (" + std::to_string(length) + " chars)");
  }

  const NameCharacterScan scan = scan_name_characters(normalized);
  if (scan.has_uppercase) {
    errors.push_back("Skill name '" + normalized + "' must be lowercase");
  }
  if (!normalized.empty() && (normalized.front() == '-' || normalized.back() == '-')) {
    errors.push_back("Skill name cannot start or end with a hyphen");
  }
  if (normalized.find("--") != std::string::npos) {
    errors.push_back("Skill name cannot contain consecutive hyphens");
  }
  if (scan.has_invalid) {
    errors.push_back("Skill name '" + normalized +
                     "' contains invalid characters. Only letters, digits, and hyphens are "
                     "allowed.");
  }

  if (directory_name.has_value() && normalized_or_raw(*directory_name) != normalized) {
    errors.push_back("Directory name '" + *directory_name + "' must match skill name '" +
                     normalized + "'");
  }
  return errors;
}

std::vector<std::string> validate_description(const std::string &description) {
  if (trim_whitespace(description).empty()) {
    return {"Field 'description' must be a non-empty string"};
  }
  const std::size_t length = code_point_count(description);
  if (length > kMaxDescriptionLength) {
    return {"Description exceeds " + std::to_string(kMaxDescriptionLength) +
            " character limit (" + std::to_string(length) + " chars)"};
  }
  return {};
}

std::vector<std::string> validate_compatibility(const std::string &compatibility) {
  const std::size_t length = code_point_count(compatibility);
  if (length > kMaxCompatibilityLength) {
    return {"Compatibility exceeds " + std::to_string(kMaxCompatibilityLength) +
            " character limit (" + std::to_string(length) + " chars)"};
  }
  return {};
}

ValidationResult validate_metadata(const FrontmatterMapping &header,
                                   const std::optional<std::string> &directory_name) {
  ValidationResult result;

  const FrontmatterValue *name = find_value(header, "name");
  if (name == nullptr) {
    result.errors.push_back("Missing required field in frontmatter: name");
  } else if (const std::string *text = name->as_string(); text != nullptr) {
    append(result.errors, validate_name(*text, directory_name));
  } else {
    result.errors.push_back("Field 'name' must be a non-empty string");
  }

  const FrontmatterValue *description = find_value(header, "description");
  if (description == nullptr) {
    result.errors.push_back("Missing required field in frontmatter: description");
  } else if (const std::string *text = description->as_string(); text != nullptr) {
    append(result.errors, validate_description(*text));
  } else {
    result.errors.push_back("Field 'description' must be a non-empty string");
  }

  if (const FrontmatterValue *compatibility = find_value(header, "compatibility");
      compatibility != nullptr && compatibility->is_string()) {
    append(result.errors, validate_compatibility(*compatibility->as_string()));
  }

  append(result.errors, validate_allowed_fields(header));
  return result;
}

ValidationResult validate(const std::filesystem::path &skill_dir) {
  std::error_code ec;
  if (!std::filesystem::exists(skill_dir, ec)) {
    return finish(skill_dir, {{"Path does not exist: " + skill_dir.string()}});
  }
  if (!std::filesystem::is_directory(skill_dir, ec)) {
    return finish(skill_dir, {{"Not a directory: " + skill_dir.string()}});
  }

  const auto skill_md = find_skill_md(skill_dir);
  if (!skill_md.has_value()) {
    return finish(skill_dir, {{"Missing required file: SKILL.md"}});
  }

  const auto content = common::read_file(*skill_md);
  if (!content.ok()) {
    return finish(skill_dir, {{content.error()}});
  }
  const auto parsed = parse_frontmatter(content.value());
  if (!parsed.ok()) {
    return finish(skill_dir, {{parsed.error().message}});
  }

  return finish(skill_dir, validate_metadata(parsed.value().header, directory_name_of(skill_dir)));
}

} // namespace skillsref::skills
