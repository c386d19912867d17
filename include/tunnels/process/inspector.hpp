#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tunnels::process {

enum class ConnectionKind {
  Inet,
  Inet4,
  Inet6,
  Tcp,
  Tcp4,
  Tcp6,
  Udp,
  Udp4,
  Udp6,
  Unix,
  All,
};

[[nodiscard]] std::optional<ConnectionKind> parse_connection_kind(std::string_view value);
[[nodiscard]] std::string_view connection_kind_name(ConnectionKind kind);

/// A process observed at query time. Never cached across inspections.
struct RunningTunnelProcess {
  int pid = 0;
  int ppid = 0;
  std::string name;
  std::vector<std::string> argv;
  std::string status;

  [[nodiscard]] std::string command_line() const;
};

class IProcessInspector {
public:
  virtual ~IProcessInspector() = default;

  /// Snapshot of the SSH-family processes currently in the process table.
  /// Processes that exit or deny access while being read are left out.
  [[nodiscard]] virtual std::vector<RunningTunnelProcess> list_ssh_processes() = 0;

  /// Sorted, de-duplicated local and remote endpoints of the process's
  /// sockets. Empty when the process is gone or cannot be inspected.
  [[nodiscard]] virtual std::vector<std::string>
  socket_connections(const RunningTunnelProcess &process, ConnectionKind kind) = 0;
};

} // namespace tunnels::process
