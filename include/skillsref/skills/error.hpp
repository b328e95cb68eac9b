#pragma once

#include <string>
#include <variant>
#include <vector>

namespace skillsref::skills {

/// The document is structurally malformed or could not be found.
struct ParseError {
  std::string message;
};

/// The document parsed but its content breaks one or more rules.
struct ValidationError {
  std::string message;
  std::vector<std::string> errors;

  [[nodiscard]] static ValidationError single(std::string message);
  [[nodiscard]] static ValidationError multiple(std::vector<std::string> errors);
};

using SkillError = std::variant<ParseError, ValidationError>;

[[nodiscard]] std::string describe(const SkillError &error);
[[nodiscard]] bool is_parse_error(const SkillError &error);
[[nodiscard]] bool is_validation_error(const SkillError &error);

/// Every violated-rule message carried by the error (a parse error yields its
/// single message).
[[nodiscard]] std::vector<std::string> error_messages(const SkillError &error);

} // namespace skillsref::skills
