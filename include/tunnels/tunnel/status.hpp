#pragma once

#include "tunnels/config/schema.hpp"
#include "tunnels/output/render.hpp"
#include "tunnels/process/inspector.hpp"

#include <string>
#include <vector>

namespace tunnels::tunnel {

inline constexpr const char *kNoPid = "-";
inline constexpr const char *kInactive = "Inactive";

struct StatusEntry {
  std::string name;
  std::string group;
  std::string hostname;
  std::string pid = kNoPid;
  std::string status = kInactive;
  std::vector<std::string> connections;

  [[nodiscard]] bool active() const { return pid != kNoPid; }
};

/// Point-in-time status of every tunnel, from a single process-table read.
[[nodiscard]] std::vector<StatusEntry>
snapshot(const std::vector<config::Tunnel> &tunnels, process::IProcessInspector &inspector,
         process::ConnectionKind kind = process::ConnectionKind::Inet4);

/// Ordered key/value view; connections are joined with newlines.
[[nodiscard]] output::Record to_record(const StatusEntry &entry);
[[nodiscard]] std::vector<output::Record> to_records(const std::vector<StatusEntry> &entries);

} // namespace tunnels::tunnel
