#include "skillsref/skills/unicode.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <limits>
#include <string>

namespace skillsref::skills {

namespace {

template <typename Fn> bool for_each_code_point(const std::string_view utf8, Fn &&fn) {
  if (utf8.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
    return false;
  }
  const auto *bytes = reinterpret_cast<const std::uint8_t *>(utf8.data());
  const auto length = static_cast<std::int32_t>(utf8.size());
  std::int32_t offset = 0;
  bool well_formed = true;
  while (offset < length) {
    UChar32 c = 0;
    U8_NEXT(bytes, offset, length, c);
    if (c < 0) {
      well_formed = false;
    }
    fn(c);
  }
  return well_formed;
}

bool is_numeric(const UChar32 c) {
  const auto category = static_cast<UCharCategory>(u_charType(c));
  return category == U_DECIMAL_DIGIT_NUMBER || category == U_LETTER_NUMBER ||
         category == U_OTHER_NUMBER;
}

} // namespace

common::Result<std::string> nfkc_normalize(const std::string_view utf8) {
  if (!for_each_code_point(utf8, [](UChar32) {})) {
    return common::Result<std::string>::failure("invalid UTF-8 input");
  }

  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *normalizer = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status)) {
    return common::Result<std::string>::failure(std::string("unable to load NFKC data: ") +
                                                u_errorName(status));
  }

  const icu::UnicodeString source = icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<std::int32_t>(utf8.size())));
  const icu::UnicodeString normalized = normalizer->normalize(source, status);
  if (U_FAILURE(status)) {
    return common::Result<std::string>::failure(std::string("NFKC normalization failed: ") +
                                                u_errorName(status));
  }

  std::string out;
  normalized.toUTF8String(out);
  return common::Result<std::string>::success(std::move(out));
}

std::string trim_whitespace(const std::string_view utf8) {
  if (utf8.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
    return std::string(utf8);
  }
  const auto *bytes = reinterpret_cast<const std::uint8_t *>(utf8.data());
  const auto length = static_cast<std::int32_t>(utf8.size());
  std::int32_t begin = -1;
  std::int32_t end = 0;
  std::int32_t offset = 0;
  while (offset < length) {
    const std::int32_t start = offset;
    UChar32 c = 0;
    U8_NEXT(bytes, offset, length, c);
    if (c >= 0 && u_isUWhiteSpace(c)) {
      continue;
    }
    if (begin < 0) {
      begin = start;
    }
    end = offset;
  }
  if (begin < 0) {
    return {};
  }
  return std::string(utf8.substr(static_cast<std::size_t>(begin),
                                 static_cast<std::size_t>(end - begin)));
}

std::size_t code_point_count(const std::string_view utf8) {
  std::size_t count = 0;
  (void)for_each_code_point(utf8, [&count](UChar32) { ++count; });
  return count;
}

NameCharacterScan scan_name_characters(const std::string_view utf8) {
  NameCharacterScan scan;
  (void)for_each_code_point(utf8, [&scan](const UChar32 c) {
    if (c < 0) {
      scan.has_invalid = true;
      return;
    }
    if (u_tolower(c) != c) {
      scan.has_uppercase = true;
    }
    if (c != '-' && !u_hasBinaryProperty(c, UCHAR_ALPHABETIC) && !is_numeric(c)) {
      scan.has_invalid = true;
    }
  });
  return scan;
}

} // namespace skillsref::skills
