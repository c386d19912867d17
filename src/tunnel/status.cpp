#include "tunnels/tunnel/status.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/tunnel/identity.hpp"

#include <set>

namespace tunnels::tunnel {

std::vector<StatusEntry> snapshot(const std::vector<config::Tunnel> &tunnels,
                                  process::IProcessInspector &inspector,
                                  const process::ConnectionKind kind) {
  std::vector<StatusEntry> entries;
  entries.reserve(tunnels.size());
  if (tunnels.empty()) {
    return entries;
  }

  const auto processes = inspector.list_ssh_processes();
  for (const auto &tunnel : tunnels) {
    StatusEntry entry;
    entry.name = tunnel.name;
    entry.group = tunnel.group_or_empty();
    entry.hostname = tunnel.hostname;

    const std::string tunnel_tag = tag(tunnel.name);
    const auto root = find_tagged(processes, tunnel_tag);
    if (root.has_value()) {
      entry.pid = std::to_string(root->pid);
      entry.status = common::title_case(root->status);

      std::set<std::string> endpoints;
      for (const auto &member : tagged(processes, tunnel_tag)) {
        for (auto &endpoint : inspector.socket_connections(member, kind)) {
          endpoints.insert(std::move(endpoint));
        }
      }
      entry.connections.assign(endpoints.begin(), endpoints.end());
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

output::Record to_record(const StatusEntry &entry) {
  return {
      {"name", entry.name},
      {"group", entry.group},
      {"hostname", entry.hostname},
      {"pid", entry.pid},
      {"status", entry.status},
      {"connections", common::join(entry.connections, "\n")},
  };
}

std::vector<output::Record> to_records(const std::vector<StatusEntry> &entries) {
  std::vector<output::Record> records;
  records.reserve(entries.size());
  for (const auto &entry : entries) {
    records.push_back(to_record(entry));
  }
  return records;
}

} // namespace tunnels::tunnel
