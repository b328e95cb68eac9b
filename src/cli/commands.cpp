#include "skillsref/cli/commands.hpp"

#include "skillsref/common/fs.hpp"
#include "skillsref/config/config.hpp"
#include "skillsref/observability/factory.hpp"
#include "skillsref/observability/global.hpp"
#include "skillsref/skills/loader.hpp"
#include "skillsref/skills/prompt.hpp"
#include "skillsref/skills/validator.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace skillsref::cli {

namespace {

std::string version_string() {
#ifdef SKILLSREF_VERSION
  std::string version = SKILLSREF_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SKILLSREF_GIT_COMMIT
  const std::string commit = SKILLSREF_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "skillsref " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

config::Config load_effective_config(std::ostream &err) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    err << "warning: " << cfg.error() << "; using defaults\n";
    config::Config defaults;
    config::apply_env_overrides(defaults);
    return defaults;
  }
  for (const auto &warning : config::validate_config(cfg.value())) {
    err << "warning: " << warning << "\n";
  }
  return cfg.value();
}

void print_errors(const skills::SkillError &error, std::ostream &err) {
  for (const auto &message : skills::error_messages(error)) {
    err << "Error: " << message << "\n";
  }
}

int run_validate(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
  if (args.size() != 1) {
    err << "usage: skillsref validate <path>\n";
    return 1;
  }
  const std::filesystem::path skill_path = resolve_skill_path(args[0]);
  const auto result = skills::validate(skill_path);
  if (result.ok()) {
    out << "Valid skill: " << skill_path.string() << "\n";
    return 0;
  }
  err << "Validation failed for " << skill_path.string() << ":\n";
  for (const auto &message : result.errors) {
    err << "  - " << message << "\n";
  }
  return 1;
}

int run_read_properties(const std::vector<std::string> &args, std::ostream &out,
                        std::ostream &err) {
  if (args.size() != 1) {
    err << "usage: skillsref read-properties <path>\n";
    return 1;
  }
  const auto properties = skills::read_properties(resolve_skill_path(args[0]));
  if (!properties.ok()) {
    observability::record_error("read-properties", skills::describe(properties.error()));
    print_errors(properties.error(), err);
    return 1;
  }
  out << skills::properties_to_json(properties.value()) << "\n";
  return 0;
}

int run_to_prompt(const std::vector<std::string> &args, const config::Config &cfg,
                  std::ostream &out, std::ostream &err) {
  if (args.empty()) {
    err << "usage: skillsref to-prompt <path>...\n";
    return 1;
  }
  std::vector<std::filesystem::path> dirs;
  dirs.reserve(args.size());
  for (const auto &arg : args) {
    dirs.push_back(resolve_skill_path(arg));
  }

  skills::PromptOptions options;
  options.escape_location = cfg.prompt.escape_location;
  const auto prompt = skills::to_prompt_for_dirs(dirs, options);
  if (!prompt.ok()) {
    observability::record_error("to-prompt", skills::describe(prompt.error()));
    print_errors(prompt.error(), err);
    return 1;
  }
  out << prompt.value() << "\n";
  return 0;
}

int run_config(const std::vector<std::string> &args, const config::Config &cfg,
               std::ostream &out, std::ostream &err) {
  if (args.empty() || args[0] == "show") {
    out << config::render_config(cfg);
    return 0;
  }
  err << "unknown config command: " << args[0] << "\n";
  return 1;
}

} // namespace

void print_help(std::ostream &out) {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  out << "\n";
  out << BOLD << CYAN << "  skillsref" << RESET << DIM
      << " - parse, validate and render Agent Skill definitions" << RESET << "\n";
  out << DIM << "  " << version_string() << RESET << "\n\n";

  out << BOLD << "  USAGE" << RESET << "\n";
  out << DIM << "  $ " << RESET << "skillsref [--config PATH] <command> [options]\n\n";

  out << BOLD << "  SKILLS" << RESET << "\n";
  out << "  " << GREEN << "validate" << RESET << " PATH" << DIM
      << "         Check a skill directory against every rule" << RESET << "\n";
  out << "  " << GREEN << "read-properties" << RESET << " PATH" << DIM
      << "  Print skill properties as JSON" << RESET << "\n";
  out << "  " << GREEN << "to-prompt" << RESET << " PATH..." << DIM
      << "     Render <available_skills> XML" << RESET << "\n\n";

  out << BOLD << "  OTHER" << RESET << "\n";
  out << "  " << GREEN << "config show" << RESET << DIM
      << "              Display effective configuration" << RESET << "\n";
  out << "  " << GREEN << "config-path" << RESET << DIM
      << "              Print the config file location" << RESET << "\n";
  out << "  " << GREEN << "version" << RESET << DIM << "                  Show version" << RESET
      << "\n";
  out << "\n";
}

std::filesystem::path resolve_skill_path(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::is_regular_file(path, ec) &&
      common::to_lower(path.filename().string()) == skills::kSkillFileNameLower) {
    const auto parent = path.parent_path();
    return parent.empty() ? std::filesystem::path(".") : parent;
  }
  return path;
}

int run_cli(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    err << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help(out);
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out);
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      err << path_result.error() << "\n";
      return 1;
    }
    out << path_result.value().string() << "\n";
    return 0;
  }

  const config::Config cfg = load_effective_config(err);
  observability::set_global_observer(observability::create_observer(cfg, err));

  int code = 1;
  if (subcommand == "validate") {
    code = run_validate(args, out, err);
  } else if (subcommand == "read-properties") {
    code = run_read_properties(args, out, err);
  } else if (subcommand == "to-prompt") {
    code = run_to_prompt(args, cfg, out, err);
  } else if (subcommand == "config") {
    code = run_config(args, cfg, out, err);
  } else {
    err << "Unknown command: " << subcommand << "\n";
    print_help(err);
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help(std::cout);
    return 0;
  }
  return run_cli(collect_args(argc - 1, argv + 1), std::cout, std::cerr);
}

} // namespace skillsref::cli
