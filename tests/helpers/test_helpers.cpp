#include "tests/helpers/test_helpers.hpp"

#include "skillsref/config/config.hpp"
#include "skillsref/observability/global.hpp"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <random>

namespace skillsref::testing {

config::Config quiet_config() {
  config::Config config;
  config.observability.backend = "none";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("skillsref-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::filesystem::path TempWorkspace::create_skill(const std::string &dir_name,
                                                  const std::string &header,
                                                  const std::string &body) const {
  create_file(dir_name + "/SKILL.md", "---\n" + header + "---\n" + body);
  return path_ / dir_name;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
  old_override = config::config_path_override();
  if (next.has_value()) {
    config::set_config_path_override(*next);
  } else {
    config::clear_config_path_override();
  }
}

ConfigOverrideGuard::~ConfigOverrideGuard() {
  if (old_override.has_value()) {
    config::set_config_path_override(*old_override);
  } else {
    config::clear_config_path_override();
  }
}

void CountingObserver::record_event(const observability::ObserverEvent &event) {
  if (events != nullptr) {
    events->push_back(event);
  }
}

void CountingObserver::record_metric(const observability::ObserverMetric &metric) {
  if (metrics != nullptr) {
    metrics->push_back(metric);
  }
}

ObserverCapture::ObserverCapture() {
  auto observer = std::make_unique<CountingObserver>();
  observer->events = &events;
  observer->metrics = &metrics;
  observability::set_global_observer(std::move(observer));
}

ObserverCapture::~ObserverCapture() {
  observability::set_global_observer(nullptr);
}

} // namespace skillsref::testing
