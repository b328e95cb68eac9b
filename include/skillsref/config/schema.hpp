#pragma once

#include <string>

namespace skillsref::config {

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "warn";
};

struct PromptConfig {
  bool escape_location = true;
};

struct Config {
  ObservabilityConfig observability;
  PromptConfig prompt;
};

} // namespace skillsref::config
