#include "skillsref/common/toml.hpp"

#include "skillsref/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace skillsref::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_basic = false;
  bool in_literal = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && !in_literal && (i == 0 || line[i - 1] != '\\')) {
      in_basic = !in_basic;
    } else if (ch == '\'' && !in_basic) {
      in_literal = !in_literal;
    }
    if (!in_basic && !in_literal && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

bool is_bare_key(const std::string &key) {
  return !key.empty() && std::all_of(key.begin(), key.end(), [](const char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
           ch == '_' || ch == '-' || ch == '.';
  });
}

bool is_terminated(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  if (value.front() == '"') {
    return value.size() >= 2 && value.back() == '"' && value[value.size() - 2] != '\\';
  }
  if (value.front() == '\'') {
    return value.size() >= 2 && value.back() == '\'';
  }
  return true;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = trim(it->second);
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[') {
      if (clean_line.back() != ']') {
        return Result<TomlDocument>::failure("Unterminated section header at line " +
                                             std::to_string(line_number));
      }
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (!is_bare_key(current_section)) {
        return Result<TomlDocument>::failure("Invalid section name at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (!is_bare_key(key)) {
      return Result<TomlDocument>::failure("Invalid key at line " + std::to_string(line_number));
    }
    if (!is_terminated(value)) {
      return Result<TomlDocument>::failure("Missing or unterminated value at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "' at line " +
                                           std::to_string(line_number));
    }
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace skillsref::common
