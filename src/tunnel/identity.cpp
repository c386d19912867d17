#include "tunnels/tunnel/identity.hpp"

#include "tunnels/common/fs.hpp"

#include <algorithm>
#include <cctype>

namespace tunnels::tunnel {

std::string tag(const std::string &name) {
  const std::string lowered = common::to_lower(common::trim(name));
  std::string out = kTagPrefix;
  out.reserve(out.size() + lowered.size());
  bool in_space = false;
  for (const char ch : lowered) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      in_space = true;
      continue;
    }
    if (in_space) {
      out.push_back('-');
      in_space = false;
    }
    out.push_back(ch);
  }
  return out;
}

bool carries_tag(const process::RunningTunnelProcess &process, const std::string &tag) {
  const std::string option = "Tag=" + tag;
  const std::string joined = "-o" + option;
  return std::any_of(process.argv.begin(), process.argv.end(), [&](const std::string &arg) {
    return arg == option || arg == joined;
  });
}

std::vector<process::RunningTunnelProcess>
tagged(const std::vector<process::RunningTunnelProcess> &processes, const std::string &tag) {
  std::vector<process::RunningTunnelProcess> out;
  for (const auto &process : processes) {
    if (carries_tag(process, tag)) {
      out.push_back(process);
    }
  }
  return out;
}

std::optional<process::RunningTunnelProcess>
find_tagged(const std::vector<process::RunningTunnelProcess> &processes, const std::string &tag) {
  const auto matches = tagged(processes, tag);
  for (const auto &candidate : matches) {
    const bool parent_matches =
        std::any_of(matches.begin(), matches.end(),
                    [&](const process::RunningTunnelProcess &other) {
                      return other.pid == candidate.ppid && other.pid != candidate.pid;
                    });
    if (!parent_matches) {
      return candidate;
    }
  }
  if (!matches.empty()) {
    return matches.front();
  }
  return std::nullopt;
}

} // namespace tunnels::tunnel
