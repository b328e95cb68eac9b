#include "skillsref/config/config.hpp"

#include "skillsref/common/fs.hpp"
#include "skillsref/common/toml.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace skillsref::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".skillsref";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

constexpr std::array<const char *, 2> KNOWN_BACKENDS = {"log", "none"};
constexpr std::array<const char *, 4> KNOWN_LEVELS = {"debug", "info", "warn", "error"};

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SKILLSREF_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

template <std::size_t N>
bool is_known(const std::array<const char *, N> &known, const std::string &value) {
  for (const char *candidate : known) {
    if (value == candidate) {
      return true;
    }
  }
  return false;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (const char *backend = std::getenv("SKILLSREF_LOG_BACKEND"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
  if (const char *level = std::getenv("SKILLSREF_LOG_LEVEL"); level != nullptr && *level) {
    config.observability.level = common::to_lower(common::trim(level));
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  const auto &doc = parsed.value();
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = common::to_lower(
      common::trim(doc.get_string("observability.level", config.observability.level)));
  config.prompt.escape_location =
      doc.get_bool("prompt.escape_location", config.prompt.escape_location);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  std::stringstream backends(config.observability.backend);
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string backend = common::to_lower(common::trim(part));
    if (!backend.empty() && backend != "noop" && !is_known(KNOWN_BACKENDS, backend)) {
      warnings.push_back("observability.backend '" + backend +
                         "' is unknown; expected log or none");
    }
  }

  if (!is_known(KNOWN_LEVELS, config.observability.level)) {
    warnings.push_back("observability.level '" + config.observability.level +
                       "' is unknown; expected debug, info, warn or error");
  }

  return warnings;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";
  out << "\n[prompt]\n";
  out << "escape_location = " << (config.prompt.escape_location ? "true" : "false") << "\n";
  return out.str();
}

} // namespace skillsref::config
