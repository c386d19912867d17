#include "tunnels/config/schema.hpp"

#include "tunnels/common/fs.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace tunnels::config {

namespace {

enum LocalField : unsigned {
  kPort = 1U << 0U,
  kLocalSocket = 1U << 1U,
  kHost = 1U << 2U,
  kRemoteSocket = 1U << 3U,
  kHostPort = 1U << 4U,
  kBind = 1U << 5U,
};

constexpr std::array<unsigned, 6> kValidCombinations = {
    kLocalSocket | kRemoteSocket,
    kLocalSocket | kHost | kHostPort,
    kPort | kHost | kHostPort,
    kPort | kRemoteSocket,
    kBind | kPort | kHost | kHostPort,
    kBind | kPort | kRemoteSocket,
};

bool populated(const std::optional<std::string> &value) {
  return value.has_value() && !value->empty();
}

bool populated(const std::optional<std::uint16_t> &value) {
  return value.has_value() && *value != 0;
}

unsigned populated_fields(const Local &local) {
  unsigned mask = 0;
  if (populated(local.port)) {
    mask |= kPort;
  }
  if (populated(local.local_socket)) {
    mask |= kLocalSocket;
  }
  if (populated(local.host)) {
    mask |= kHost;
  }
  if (populated(local.remote_socket)) {
    mask |= kRemoteSocket;
  }
  if (populated(local.host_port)) {
    mask |= kHostPort;
  }
  if (populated(local.bind_address)) {
    mask |= kBind;
  }
  return mask;
}

std::string describe_fields(const unsigned mask) {
  std::vector<std::string> names;
  if ((mask & kBind) != 0U) {
    names.emplace_back("bind_address");
  }
  if ((mask & kPort) != 0U) {
    names.emplace_back("port");
  }
  if ((mask & kLocalSocket) != 0U) {
    names.emplace_back("local_socket");
  }
  if ((mask & kHost) != 0U) {
    names.emplace_back("host");
  }
  if ((mask & kRemoteSocket) != 0U) {
    names.emplace_back("remote_socket");
  }
  if ((mask & kHostPort) != 0U) {
    names.emplace_back("host_port");
  }
  return names.empty() ? "none" : common::join(names, ", ");
}

} // namespace

std::string Dynamic::address() const {
  if (bind_address.has_value() && !bind_address->empty()) {
    return "[" + *bind_address + ":]" + std::to_string(port);
  }
  return std::to_string(port);
}

common::Status Local::validate() const {
  const unsigned mask = populated_fields(*this);
  std::size_t matches = 0;
  for (const unsigned combination : kValidCombinations) {
    if (mask == combination) {
      ++matches;
    }
  }
  if (matches != 1) {
    return common::Status::error(common::ErrorKind::Config,
                                 "Invalid combination of values (set: " + describe_fields(mask) +
                                     "). Please check the configuration.");
  }
  return common::Status::success();
}

std::string Local::address() const {
  std::vector<std::string> segments;
  if (populated(port)) {
    segments.push_back(std::to_string(*port));
  } else if (populated(local_socket)) {
    segments.push_back(*local_socket);
  }
  if (populated(host)) {
    segments.push_back(*host);
  } else if (populated(remote_socket)) {
    segments.push_back(*remote_socket);
  }
  if (populated(host_port)) {
    segments.push_back(std::to_string(*host_port));
  }

  std::string out = common::join(segments, ":");
  if (populated(bind_address)) {
    out = "[" + *bind_address + ":]" + out;
  }
  return out;
}

std::vector<TunnelGroup> Config::groups() const {
  std::vector<TunnelGroup> out;
  for (const auto &tunnel : tunnels) {
    if (!tunnel.group.has_value() || tunnel.group->empty()) {
      continue;
    }
    auto it = std::find_if(out.begin(), out.end(),
                           [&](const TunnelGroup &group) { return group.name == *tunnel.group; });
    if (it == out.end()) {
      out.push_back(TunnelGroup{.name = *tunnel.group, .tunnels = {}});
      it = std::prev(out.end());
    }
    it->tunnels.push_back(tunnel);
  }
  return out;
}

} // namespace tunnels::config
