#pragma once

#include "tunnels/process/inspector.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tunnels::tunnel {

inline constexpr const char *kTagPrefix = "tunnels-";

/// Stable process tag for a tunnel name: `tunnels-` followed by the name
/// trimmed, lower-cased, with every whitespace run collapsed to `-`.
[[nodiscard]] std::string tag(const std::string &name);

/// True when one argument is exactly `Tag=<tag>` or `-oTag=<tag>`.
[[nodiscard]] bool carries_tag(const process::RunningTunnelProcess &process,
                               const std::string &tag);

/// Every process carrying the tag, in input order.
[[nodiscard]] std::vector<process::RunningTunnelProcess>
tagged(const std::vector<process::RunningTunnelProcess> &processes, const std::string &tag);

/// Root of the tagged process tree: a match whose parent is not itself a
/// match. With autossh this is the supervisor rather than its ssh child.
[[nodiscard]] std::optional<process::RunningTunnelProcess>
find_tagged(const std::vector<process::RunningTunnelProcess> &processes, const std::string &tag);

} // namespace tunnels::tunnel
