#pragma once

#include "tunnels/process/inspector.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tunnels::process {

struct StatFields {
  std::string comm;
  char state = '?';
  int ppid = 0;
};

struct SocketEntry {
  std::optional<std::string> local;
  std::optional<std::string> remote;
  std::uint64_t inode = 0;
};

/// Parse `/proc/<pid>/stat`. comm may contain spaces and parentheses.
[[nodiscard]] std::optional<StatFields> parse_stat(const std::string &content);

/// Kernel state letter to the lower-case name used in status output.
[[nodiscard]] std::string describe_state(char state);

/// Split NUL-separated `/proc/<pid>/cmdline` content.
[[nodiscard]] std::vector<std::string> parse_cmdline(const std::string &raw);

/// `0100007F` -> `127.0.0.1` (kernel prints the address word in host order).
[[nodiscard]] std::optional<std::string> decode_ipv4(const std::string &hex);
[[nodiscard]] std::optional<std::string> decode_ipv6(const std::string &hex);

/// `ADDR:PORT` from `/proc/net/{tcp,udp}[6]`; nullopt for port 0 or malformed input.
[[nodiscard]] std::optional<std::string> decode_endpoint(const std::string &field, bool ipv6);

/// One data line of `/proc/<pid>/net/{tcp,tcp6,udp,udp6}`; nullopt for the header.
[[nodiscard]] std::optional<SocketEntry> parse_net_line(const std::string &line, bool ipv6);

/// One data line of `/proc/<pid>/net/unix`; the socket path becomes the local endpoint.
[[nodiscard]] std::optional<SocketEntry> parse_unix_line(const std::string &line);

/// Socket inodes referenced by `/proc/<pid>/fd/*`.
[[nodiscard]] std::vector<std::uint64_t> socket_inodes(const std::filesystem::path &proc_root,
                                                       int pid);

/// Read one process; nullopt if it vanished or is unreadable.
[[nodiscard]] std::optional<RunningTunnelProcess>
read_process(const std::filesystem::path &proc_root, int pid);

/// Lazy, finite, single-pass walk over a proc tree yielding processes whose
/// executable name is in `names`.
class ProcessScan {
public:
  ProcessScan(std::filesystem::path proc_root, std::vector<std::string> names);

  [[nodiscard]] std::optional<RunningTunnelProcess> next();
  [[nodiscard]] std::size_t visited() const { return visited_; }

private:
  [[nodiscard]] bool wanted(const std::string &name) const;

  std::filesystem::path proc_root_;
  std::vector<std::string> names_;
  std::filesystem::directory_iterator it_;
  std::size_t visited_ = 0;
};

class ProcfsInspector final : public IProcessInspector {
public:
  explicit ProcfsInspector(std::vector<std::string> names = {"ssh", "autossh"},
                           std::filesystem::path proc_root = "/proc");

  [[nodiscard]] std::vector<RunningTunnelProcess> list_ssh_processes() override;
  [[nodiscard]] std::vector<std::string> socket_connections(const RunningTunnelProcess &process,
                                                            ConnectionKind kind) override;

private:
  std::vector<std::string> names_;
  std::filesystem::path proc_root_;
};

} // namespace tunnels::process
