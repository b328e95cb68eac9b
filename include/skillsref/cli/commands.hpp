#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace skillsref::cli {

void print_help(std::ostream &out);

/// A path naming an existing skill.md file (any case) stands for its
/// directory.
[[nodiscard]] std::filesystem::path resolve_skill_path(const std::filesystem::path &path);

/// Dispatch a command line (program name excluded). Returns the exit code.
int run_cli(std::vector<std::string> args, std::ostream &out, std::ostream &err);
int run_cli(int argc, char **argv);

} // namespace skillsref::cli
