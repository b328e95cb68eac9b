#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace skillsref::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails with both strings in the message when `needle` is absent.
inline void require_contains(const std::string &haystack, const std::string &needle) {
  if (haystack.find(needle) == std::string::npos) {
    throw std::runtime_error("expected to find \"" + needle + "\" in:\n" + haystack);
  }
}

} // namespace skillsref::tests
