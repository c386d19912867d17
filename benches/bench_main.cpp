#include <iostream>

void run_config_benchmark();
void run_identity_benchmark();
void run_process_scan_benchmark();

int main() {
  std::cout << "tunnels benchmarks\n";
  run_config_benchmark();
  run_identity_benchmark();
  run_process_scan_benchmark();
  return 0;
}
