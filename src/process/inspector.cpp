#include "tunnels/process/inspector.hpp"

#include "tunnels/common/fs.hpp"

#include <array>
#include <utility>

namespace tunnels::process {

namespace {

constexpr std::array<std::pair<std::string_view, ConnectionKind>, 11> kKinds = {{
    {"inet", ConnectionKind::Inet},
    {"inet4", ConnectionKind::Inet4},
    {"inet6", ConnectionKind::Inet6},
    {"tcp", ConnectionKind::Tcp},
    {"tcp4", ConnectionKind::Tcp4},
    {"tcp6", ConnectionKind::Tcp6},
    {"udp", ConnectionKind::Udp},
    {"udp4", ConnectionKind::Udp4},
    {"udp6", ConnectionKind::Udp6},
    {"unix", ConnectionKind::Unix},
    {"all", ConnectionKind::All},
}};

} // namespace

std::optional<ConnectionKind> parse_connection_kind(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  for (const auto &[name, kind] : kKinds) {
    if (name == normalized) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string_view connection_kind_name(const ConnectionKind kind) {
  for (const auto &[name, candidate] : kKinds) {
    if (candidate == kind) {
      return name;
    }
  }
  return "inet4";
}

std::string RunningTunnelProcess::command_line() const { return common::join(argv, " "); }

} // namespace tunnels::process
