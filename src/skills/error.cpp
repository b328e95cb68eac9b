#include "skillsref/skills/error.hpp"

#include <type_traits>

namespace skillsref::skills {

ValidationError ValidationError::single(std::string message) {
  ValidationError error;
  error.errors.push_back(message);
  error.message = std::move(message);
  return error;
}

ValidationError ValidationError::multiple(std::vector<std::string> errors) {
  ValidationError error;
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) {
      error.message += "; ";
    }
    error.message += errors[i];
  }
  error.errors = std::move(errors);
  return error;
}

std::string describe(const SkillError &error) {
  return std::visit([](const auto &err) { return err.message; }, error);
}

bool is_parse_error(const SkillError &error) {
  return std::holds_alternative<ParseError>(error);
}

bool is_validation_error(const SkillError &error) {
  return std::holds_alternative<ValidationError>(error);
}

std::vector<std::string> error_messages(const SkillError &error) {
  return std::visit(
      [](const auto &err) -> std::vector<std::string> {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, ValidationError>) {
          if (!err.errors.empty()) {
            return err.errors;
          }
        }
        return {err.message};
      },
      error);
}

} // namespace skillsref::skills
