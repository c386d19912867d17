#pragma once

#include "tunnels/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tunnels::config {

/// SOCKS proxy forwarding (`ssh -D`).
struct Dynamic {
  std::optional<std::string> bind_address;
  std::uint16_t port = 0;

  /// `[bind_address:]port`, or just the port when no bind address is set.
  [[nodiscard]] std::string address() const;
};

/// Local port/socket forwarding (`ssh -L`).
///
/// The populated fields must form exactly one of:
///   local_socket + remote_socket
///   local_socket + host + host_port
///   port + host + host_port
///   port + remote_socket
///   bind_address + port + host + host_port
///   bind_address + port + remote_socket
struct Local {
  std::optional<std::uint16_t> port;
  std::optional<std::string> local_socket;
  std::optional<std::string> host;
  std::optional<std::string> remote_socket;
  std::optional<std::uint16_t> host_port;
  std::optional<std::string> bind_address;

  [[nodiscard]] common::Status validate() const;

  /// Render the ssh forwarding argument. Only meaningful when validate() succeeds.
  [[nodiscard]] std::string address() const;
};

using Forwarding = std::variant<Dynamic, Local>;

struct Tunnel {
  std::string name;
  std::optional<std::string> group;
  std::string hostname;
  Forwarding forwarding;

  [[nodiscard]] bool is_dynamic() const { return std::holds_alternative<Dynamic>(forwarding); }
  [[nodiscard]] std::string group_or_empty() const { return group.value_or(""); }
};

struct TunnelGroup {
  std::string name;
  std::vector<Tunnel> tunnels;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  bool autossh = true;
  ObservabilityConfig observability;
  std::vector<Tunnel> tunnels;

  /// Groups in first-seen order, built from each tunnel's `group` field.
  [[nodiscard]] std::vector<TunnelGroup> groups() const;
};

} // namespace tunnels::config
