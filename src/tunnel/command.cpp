#include "tunnels/tunnel/command.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/tunnel/identity.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace tunnels::tunnel {

std::optional<std::string> PathExecutableLocator::locate(const std::string &name) const {
  const auto found = common::find_executable(name);
  if (!found.has_value()) {
    return std::nullopt;
  }
  return found->string();
}

const std::vector<std::string> &default_ssh_options() {
  static const std::vector<std::string> options = {
      "ServerAliveInterval=60", "ServerAliveCountMax=3",   "TCPKeepAlive=yes",
      "ConnectTimeout=10",      "ConnectionAttempts=3",    "BatchMode=yes",
      "StrictHostKeyChecking=no", "ExitOnForwardFailure=no",
  };
  return options;
}

bool autossh_available(const IExecutableLocator &locator) {
  return locator.locate("autossh").has_value();
}

std::pair<std::string, std::string> forward_argument(const config::Tunnel &tunnel) {
  return std::visit(
      [](const auto &forwarding) -> std::pair<std::string, std::string> {
        using T = std::decay_t<decltype(forwarding)>;
        if constexpr (std::is_same_v<T, config::Dynamic>) {
          return {"-D", forwarding.address()};
        } else {
          return {"-L", forwarding.address()};
        }
      },
      tunnel.forwarding);
}

LaunchCommand build_start_command(const config::Tunnel &tunnel, const bool use_autossh,
                                  const IExecutableLocator &locator) {
  LaunchCommand command;
  std::optional<std::string> autossh;
  if (use_autossh) {
    autossh = locator.locate("autossh");
  }

  if (autossh.has_value()) {
    command.launcher = "autossh";
    command.argv = {*autossh, "-M", "0", "-f", "-N", "-n"};
  } else {
    command.launcher = "ssh";
    command.argv = {locator.locate("ssh").value_or("ssh"), "-f", "-N", "-n"};
  }

  auto [flag, address] = forward_argument(tunnel);
  command.argv.push_back(std::move(flag));
  command.argv.push_back(std::move(address));
  command.argv.push_back(tunnel.hostname);
  command.argv.emplace_back("-o");
  command.argv.push_back("Tag=" + tag(tunnel.name));
  for (const auto &option : default_ssh_options()) {
    command.argv.emplace_back("-o");
    command.argv.push_back(option);
  }
  return command;
}

} // namespace tunnels::tunnel
