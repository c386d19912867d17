#pragma once

#include "tunnels/config/schema.hpp"

#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace tunnels::tunnel {

class IExecutableLocator {
public:
  virtual ~IExecutableLocator() = default;

  [[nodiscard]] virtual std::optional<std::string> locate(const std::string &name) const = 0;
};

/// Resolves names against the PATH environment variable.
class PathExecutableLocator final : public IExecutableLocator {
public:
  [[nodiscard]] std::optional<std::string> locate(const std::string &name) const override;
};

struct LaunchCommand {
  std::vector<std::string> argv;
  std::string launcher;
};

[[nodiscard]] const std::vector<std::string> &default_ssh_options();

[[nodiscard]] bool autossh_available(const IExecutableLocator &locator);

/// `-D`/`-L` flag and its forwarding argument for the tunnel's forwarding variant.
[[nodiscard]] std::pair<std::string, std::string> forward_argument(const config::Tunnel &tunnel);

/// Full argument vector for a tunnel. Falls back to plain ssh when autossh
/// is requested but cannot be located.
[[nodiscard]] LaunchCommand build_start_command(const config::Tunnel &tunnel, bool use_autossh,
                                                const IExecutableLocator &locator);

} // namespace tunnels::tunnel
