#pragma once

#include "skillsref/common/result.hpp"
#include <string>
#include <unordered_map>

namespace skillsref::common {

/// Flat view of a TOML document: section keys are joined with '.', values
/// are stored as raw (still quoted) text.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace skillsref::common
