#pragma once

#include <string>
#include <vector>

namespace tunnels::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitUsage = 2;

void print_help();
[[nodiscard]] std::string version_string();

/// Entry point shared by main() and the tests. Returns the process exit code.
int run_cli(int argc, char **argv);
int run_cli(std::vector<std::string> args);

} // namespace tunnels::cli
