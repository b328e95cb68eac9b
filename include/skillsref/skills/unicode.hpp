#pragma once

#include "skillsref/common/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace skillsref::skills {

/// NFKC form of a UTF-8 string. Fails on ill-formed input.
[[nodiscard]] common::Result<std::string> nfkc_normalize(std::string_view utf8);

/// Strip leading and trailing White_Space code points (ASCII space, NBSP,
/// U+2003, U+3000 and the rest). Ill-formed bytes are kept.
[[nodiscard]] std::string trim_whitespace(std::string_view utf8);

/// Number of code points. Each ill-formed sequence counts as one.
[[nodiscard]] std::size_t code_point_count(std::string_view utf8);

struct NameCharacterScan {
  bool has_uppercase = false;
  bool has_invalid = false;
};

/// Classify the code points of a skill name. A code point is valid when it is
/// '-', alphabetic, or numeric (Nd, Nl, No). It is uppercase when lowering it
/// yields a different code point.
[[nodiscard]] NameCharacterScan scan_name_characters(std::string_view utf8);

} // namespace skillsref::skills
