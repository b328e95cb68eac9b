#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <string>

namespace skillsref::bench {

inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << "\n";
}

/// Creates `<tmp>/skillsref-bench-<random>/<name>/SKILL.md` and returns the skill directory.
inline std::filesystem::path make_bench_skill(const std::string &name) {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto dir = std::filesystem::temp_directory_path() /
                   ("skillsref-bench-" + std::to_string(rng())) / name;
  std::filesystem::create_directories(dir);
  std::ofstream out(dir / "SKILL.md", std::ios::trunc);
  out << "---\n"
      << "name: " << name << "\n"
      << "description: Benchmark skill used to time parsing & rendering\n"
      << "license: MIT\n"
      << "allowed-tools: Bash(git:*) Read\n"
      << "metadata:\n"
      << "  author: bench\n"
      << "  version: \"1.0\"\n"
      << "---\n"
      << "# Instructions\n\nDo the benchmark work.\n";
  return dir;
}

} // namespace skillsref::bench
