#include <iostream>

void run_scheduler_benchmarks();
void run_store_benchmarks();
void run_config_benchmark();

int main() {
  std::cout << "conductor benchmarks\n";
  run_scheduler_benchmarks();
  run_store_benchmarks();
  run_config_benchmark();
  return 0;
}
