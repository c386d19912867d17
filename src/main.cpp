#include "tunnels/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);
  return tunnels::cli::run_cli(argc, argv);
}
