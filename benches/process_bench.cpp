#include "bench_common.hpp"

#include "tunnels/process/procfs.hpp"

void run_process_scan_benchmark() {
  tunnels::process::ProcfsInspector inspector;
  tunnels::bench::run_bench("procfs_list_ssh_processes", 50, [&inspector] {
    (void)inspector.list_ssh_processes();
  });
}
