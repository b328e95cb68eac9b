#include <iostream>

void run_startup_benchmark();
void run_parse_benchmark();
void run_validate_benchmark();
void run_prompt_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "skillsref Benchmarks\n";
  run_startup_benchmark();
  run_parse_benchmark();
  run_validate_benchmark();
  run_prompt_benchmark();
  run_config_benchmark();
  return 0;
}
