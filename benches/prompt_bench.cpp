#include "bench_common.hpp"

#include "skillsref/skills/prompt.hpp"

#include <vector>

void run_prompt_benchmark() {
  std::vector<std::filesystem::path> dirs;
  for (int i = 0; i < 8; ++i) {
    dirs.push_back(skillsref::bench::make_bench_skill("prompt-bench-" + std::to_string(i)));
  }

  skillsref::bench::run_bench("prompt_for_dirs", 200,
                              [&] { (void)skillsref::skills::to_prompt_for_dirs(dirs); });
}
