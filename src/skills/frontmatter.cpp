#include "skillsref/skills/frontmatter.hpp"

#include "skillsref/common/json_util.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <regex>
#include <type_traits>

namespace skillsref::skills {

namespace {

constexpr std::string_view kDelimiter = "---";
constexpr const char *kStrTag = "tag:yaml.org,2002:str";

struct Line {
  std::size_t begin = 0;
  std::size_t end = 0;  // excludes the newline
  std::size_t next = 0; // first byte of the following line
};

Line line_at(const std::string &content, const std::size_t begin) {
  Line line;
  line.begin = begin;
  const std::size_t newline = content.find('\n', begin);
  if (newline == std::string::npos) {
    line.end = content.size();
    line.next = content.size();
  } else {
    line.end = newline;
    line.next = newline + 1;
  }
  return line;
}

bool is_delimiter(const std::string &content, const Line &line) {
  std::string_view text(content.data() + line.begin, line.end - line.begin);
  if (!text.empty() && text.back() == '\r') {
    text.remove_suffix(1);
  }
  return text == kDelimiter;
}

bool is_bool_literal(const std::string &text, bool *value) {
  static const std::array<std::string_view, 3> truthy = {"true", "True", "TRUE"};
  static const std::array<std::string_view, 3> falsy = {"false", "False", "FALSE"};
  for (const auto candidate : truthy) {
    if (text == candidate) {
      *value = true;
      return true;
    }
  }
  for (const auto candidate : falsy) {
    if (text == candidate) {
      *value = false;
      return true;
    }
  }
  return false;
}

bool parse_integer(const std::string &text, std::int64_t *value) {
  static const std::regex decimal(R"(^[-+]?[0-9]+$)");
  static const std::regex octal(R"(^0o[0-7]+$)");
  static const std::regex hex(R"(^0x[0-9a-fA-F]+$)");

  int base = 10;
  std::string digits = text;
  if (std::regex_match(text, decimal)) {
    if (!digits.empty() && digits.front() == '+') {
      digits.erase(0, 1);
    }
  } else if (std::regex_match(text, octal)) {
    base = 8;
    digits = text.substr(2);
  } else if (std::regex_match(text, hex)) {
    base = 16;
    digits = text.substr(2);
  } else {
    return false;
  }

  const auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), *value, base);
  // Out-of-range decimals fall through to the float rule.
  return ec == std::errc() && ptr == digits.data() + digits.size();
}

bool parse_float(const std::string &text, double *value) {
  static const std::regex number(R"(^[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?$)");
  static const std::regex infinity(R"(^[-+]?\.(inf|Inf|INF)$)");
  static const std::regex not_a_number(R"(^\.(nan|NaN|NAN)$)");

  if (std::regex_match(text, infinity)) {
    *value = text.front() == '-' ? -std::numeric_limits<double>::infinity()
                                 : std::numeric_limits<double>::infinity();
    return true;
  }
  if (std::regex_match(text, not_a_number)) {
    *value = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  if (!std::regex_match(text, number)) {
    return false;
  }

  std::string digits = text;
  if (digits.front() == '+') {
    digits.erase(0, 1);
  }
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), *value);
  if (ec == std::errc::result_out_of_range) {
    *value = digits.front() == '-' ? -std::numeric_limits<double>::infinity()
                                   : std::numeric_limits<double>::infinity();
    return true;
  }
  return ec == std::errc() && ptr == digits.data() + digits.size();
}

FrontmatterValue resolve_scalar(const YAML::Node &node) {
  const std::string &text = node.Scalar();
  const std::string &tag = node.Tag();
  if (tag == "!" || tag == kStrTag) {
    return FrontmatterValue(text);
  }

  bool flag = false;
  if (is_bool_literal(text, &flag)) {
    return FrontmatterValue(flag);
  }

  std::int64_t integer = 0;
  if (parse_integer(text, &integer)) {
    return FrontmatterValue(integer);
  }

  double number = 0.0;
  if (parse_float(text, &number)) {
    return FrontmatterValue(number);
  }
  return FrontmatterValue(text);
}

// Aliases are shared inside the yaml-cpp tree but copied out here, so the
// number of converted values is capped.
constexpr std::size_t kMaxConvertedValues = 10000;

ParseError expansion_limit_error() {
  return ParseError{"Invalid YAML in frontmatter: alias expansion limit exceeded"};
}

common::Result<FrontmatterValue, ParseError> convert_node(const YAML::Node &node,
                                                          std::size_t &budget);

common::Result<FrontmatterMapping, ParseError> convert_mapping(const YAML::Node &node,
                                                               std::size_t &budget) {
  FrontmatterMapping mapping;
  for (const auto &entry : node) {
    if (!entry.first.IsScalar()) {
      return common::Result<FrontmatterMapping, ParseError>::failure(
          ParseError{"Invalid YAML in frontmatter: mapping keys must be scalars"});
    }
    auto value = convert_node(entry.second, budget);
    if (!value.ok()) {
      return common::Result<FrontmatterMapping, ParseError>::failure(value.error());
    }
    set_value(mapping, entry.first.Scalar(), std::move(value.value()));
  }
  return common::Result<FrontmatterMapping, ParseError>::success(std::move(mapping));
}

common::Result<FrontmatterValue, ParseError> convert_node(const YAML::Node &node,
                                                          std::size_t &budget) {
  using ValueResult = common::Result<FrontmatterValue, ParseError>;
  if (budget == 0) {
    return ValueResult::failure(expansion_limit_error());
  }
  --budget;

  switch (node.Type()) {
  case YAML::NodeType::Scalar:
    return ValueResult::success(resolve_scalar(node));
  case YAML::NodeType::Sequence: {
    FrontmatterSequence sequence;
    sequence.reserve(std::min(node.size(), budget));
    for (const auto &item : node) {
      auto value = convert_node(item, budget);
      if (!value.ok()) {
        return value;
      }
      sequence.push_back(std::move(value.value()));
    }
    return ValueResult::success(FrontmatterValue(std::move(sequence)));
  }
  case YAML::NodeType::Map: {
    auto mapping = convert_mapping(node, budget);
    if (!mapping.ok()) {
      return ValueResult::failure(mapping.error());
    }
    return ValueResult::success(FrontmatterValue(std::move(mapping.value())));
  }
  case YAML::NodeType::Null:
  case YAML::NodeType::Undefined:
  default:
    return ValueResult::success(FrontmatterValue());
  }
}

std::string format_double(const double value) {
  if (std::isnan(value)) {
    return ".nan";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-.inf" : ".inf";
  }
  std::array<char, 64> buffer{};
  const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  std::string out = ec == std::errc() ? std::string(buffer.data(), ptr) : std::to_string(value);
  if (out.find_first_of(".e") == std::string::npos) {
    out += ".0";
  }
  return out;
}

} // namespace

const FrontmatterValue *find_value(const FrontmatterMapping &mapping, const std::string_view key) {
  for (const auto &[entry_key, value] : mapping) {
    if (entry_key == key) {
      return &value;
    }
  }
  return nullptr;
}

bool has_key(const FrontmatterMapping &mapping, const std::string_view key) {
  return find_value(mapping, key) != nullptr;
}

void set_value(FrontmatterMapping &mapping, std::string key, FrontmatterValue value) {
  for (auto &entry : mapping) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return;
    }
  }
  mapping.emplace_back(std::move(key), std::move(value));
}

std::string_view type_name(const FrontmatterValue &value) {
  return std::visit(
      [](const auto &v) -> std::string_view {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return "boolean";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return "integer";
        } else if constexpr (std::is_same_v<T, double>) {
          return "float";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return "string";
        } else if constexpr (std::is_same_v<T, FrontmatterSequence>) {
          return "sequence";
        } else {
          return "mapping";
        }
      },
      value.data);
}

std::string stringify(const FrontmatterValue &value) {
  return std::visit(
      [&value](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          return format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return to_compact_json(value);
        }
      },
      value.data);
}

std::string to_compact_json(const FrontmatterValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          if (!std::isfinite(v)) {
            return common::json_quote(format_double(v));
          }
          return format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return common::json_quote(v);
        } else if constexpr (std::is_same_v<T, FrontmatterSequence>) {
          std::string out = "[";
          for (std::size_t i = 0; i < v.size(); ++i) {
            if (i > 0) {
              out += ",";
            }
            out += to_compact_json(v[i]);
          }
          return out + "]";
        } else {
          std::string out = "{";
          for (std::size_t i = 0; i < v.size(); ++i) {
            if (i > 0) {
              out += ",";
            }
            out += common::json_quote(v[i].first) + ":" + to_compact_json(v[i].second);
          }
          return out + "}";
        }
      },
      value.data);
}

common::Result<FrontmatterMapping, ParseError> decode_yaml_mapping(const std::string &yaml) {
  using MappingResult = common::Result<FrontmatterMapping, ParseError>;
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception &e) {
    return MappingResult::failure(ParseError{std::string("Invalid YAML in frontmatter: ") + e.what()});
  }

  if (root.IsNull() || !root.IsDefined()) {
    return MappingResult::success({});
  }
  if (!root.IsMap()) {
    return MappingResult::failure(ParseError{"Frontmatter must be a YAML mapping"});
  }
  std::size_t budget = kMaxConvertedValues;
  return convert_mapping(root, budget);
}

common::Result<FrontmatterDocument, ParseError> parse_frontmatter(const std::string &content) {
  using DocumentResult = common::Result<FrontmatterDocument, ParseError>;

  const Line opening = line_at(content, 0);
  if (!is_delimiter(content, opening)) {
    return DocumentResult::failure(
        ParseError{"SKILL.md must start with YAML frontmatter (---)"});
  }

  std::size_t cursor = opening.next;
  while (cursor < content.size()) {
    const Line line = line_at(content, cursor);
    if (is_delimiter(content, line)) {
      auto header = decode_yaml_mapping(content.substr(opening.next, line.begin - opening.next));
      if (!header.ok()) {
        return DocumentResult::failure(header.error());
      }
      FrontmatterDocument doc;
      doc.header = std::move(header.value());
      doc.body = content.substr(line.next);
      return DocumentResult::success(std::move(doc));
    }
    cursor = line.next;
  }

  return DocumentResult::failure(
      ParseError{"SKILL.md frontmatter not properly closed with ---"});
}

} // namespace skillsref::skills
