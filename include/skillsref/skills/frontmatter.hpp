#pragma once

#include "skillsref/common/result.hpp"
#include "skillsref/skills/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace skillsref::skills {

struct FrontmatterValue;

using FrontmatterSequence = std::vector<FrontmatterValue>;

/// Header entries in document order. Keys are unique; a repeated key keeps
/// its first position and its last value.
using FrontmatterMapping = std::vector<std::pair<std::string, FrontmatterValue>>;

struct FrontmatterValue {
  using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                               FrontmatterSequence, FrontmatterMapping>;

  Storage data;

  FrontmatterValue() = default;
  FrontmatterValue(bool value) : data(std::in_place_type<bool>, value) {}
  FrontmatterValue(std::int64_t value) : data(std::in_place_type<std::int64_t>, value) {}
  FrontmatterValue(int value) : data(std::in_place_type<std::int64_t>, value) {}
  FrontmatterValue(double value) : data(std::in_place_type<double>, value) {}
  FrontmatterValue(std::string value) : data(std::in_place_type<std::string>, std::move(value)) {}
  FrontmatterValue(const char *value) : data(std::in_place_type<std::string>, value) {}
  FrontmatterValue(FrontmatterSequence value)
      : data(std::in_place_type<FrontmatterSequence>, std::move(value)) {}
  FrontmatterValue(FrontmatterMapping value)
      : data(std::in_place_type<FrontmatterMapping>, std::move(value)) {}

  [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(data); }
  [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(data); }
  [[nodiscard]] bool is_sequence() const {
    return std::holds_alternative<FrontmatterSequence>(data);
  }
  [[nodiscard]] bool is_mapping() const {
    return std::holds_alternative<FrontmatterMapping>(data);
  }
  [[nodiscard]] bool is_scalar() const { return !is_sequence() && !is_mapping(); }

  [[nodiscard]] const std::string *as_string() const { return std::get_if<std::string>(&data); }
  [[nodiscard]] const FrontmatterMapping *as_mapping() const {
    return std::get_if<FrontmatterMapping>(&data);
  }
  [[nodiscard]] const FrontmatterSequence *as_sequence() const {
    return std::get_if<FrontmatterSequence>(&data);
  }
};

struct FrontmatterDocument {
  FrontmatterMapping header;
  std::string body;
};

[[nodiscard]] const FrontmatterValue *find_value(const FrontmatterMapping &mapping,
                                                 std::string_view key);
[[nodiscard]] bool has_key(const FrontmatterMapping &mapping, std::string_view key);

/// Insert or overwrite, keeping keys unique.
void set_value(FrontmatterMapping &mapping, std::string key, FrontmatterValue value);

[[nodiscard]] std::string_view type_name(const FrontmatterValue &value);

/// Text form of a value. Strings are returned as-is; booleans as true/false;
/// integers in decimal; floats in shortest round-trip form that always
/// carries a '.' or an exponent; null as "null"; collections as compact JSON.
[[nodiscard]] std::string stringify(const FrontmatterValue &value);

/// Compact JSON rendering (no insignificant whitespace, mapping order kept).
[[nodiscard]] std::string to_compact_json(const FrontmatterValue &value);

/// Split a SKILL.md document into its YAML header and markdown body.
[[nodiscard]] common::Result<FrontmatterDocument, ParseError>
parse_frontmatter(const std::string &content);

/// Decode a YAML mapping. Exposed for callers that hold header text without
/// the surrounding delimiters.
[[nodiscard]] common::Result<FrontmatterMapping, ParseError>
decode_yaml_mapping(const std::string &yaml);

} // namespace skillsref::skills
