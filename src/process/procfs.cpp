#include "tunnels/process/procfs.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstring>
#include <set>
#include <sstream>
#include <unordered_set>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace tunnels::process {

namespace {

struct NetTable {
  const char *file;
  bool ipv6;
};

constexpr NetTable kTcp4{"tcp", false};
constexpr NetTable kTcp6{"tcp6", true};
constexpr NetTable kUdp4{"udp", false};
constexpr NetTable kUdp6{"udp6", true};

std::vector<NetTable> tables_for(const ConnectionKind kind) {
  switch (kind) {
  case ConnectionKind::Inet:
  case ConnectionKind::All:
    return {kTcp4, kTcp6, kUdp4, kUdp6};
  case ConnectionKind::Inet4:
    return {kTcp4, kUdp4};
  case ConnectionKind::Inet6:
    return {kTcp6, kUdp6};
  case ConnectionKind::Tcp:
    return {kTcp4, kTcp6};
  case ConnectionKind::Tcp4:
    return {kTcp4};
  case ConnectionKind::Tcp6:
    return {kTcp6};
  case ConnectionKind::Udp:
    return {kUdp4, kUdp6};
  case ConnectionKind::Udp4:
    return {kUdp4};
  case ConnectionKind::Udp6:
    return {kUdp6};
  case ConnectionKind::Unix:
    return {};
  }
  return {};
}

bool includes_unix(const ConnectionKind kind) {
  return kind == ConnectionKind::Unix || kind == ConnectionKind::All;
}

template <typename T> std::optional<T> parse_number(const std::string &text, const int base = 10) {
  T value{};
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value, base);
  if (ec != std::errc() || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> tokenize(const std::string &line) {
  std::istringstream stream(line);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

bool is_slot_token(const std::string &token) {
  if (token.size() < 2 || token.back() != ':') {
    return false;
  }
  return std::all_of(token.begin(), token.end() - 1,
                     [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace

std::optional<StatFields> parse_stat(const std::string &content) {
  const std::size_t comm_start = content.find('(');
  const std::size_t comm_end = content.rfind(')');
  if (comm_start == std::string::npos || comm_end == std::string::npos || comm_end <= comm_start) {
    return std::nullopt;
  }
  if (comm_end + 2 >= content.size()) {
    return std::nullopt;
  }

  StatFields fields;
  fields.comm = content.substr(comm_start + 1, comm_end - comm_start - 1);

  std::istringstream stream(content.substr(comm_end + 2));
  std::string state;
  int ppid = 0;
  stream >> state >> ppid;
  if (state.empty() || stream.fail()) {
    return std::nullopt;
  }
  fields.state = state.front();
  fields.ppid = ppid;
  return fields;
}

std::string describe_state(const char state) {
  switch (state) {
  case 'R':
    return "running";
  case 'S':
    return "sleeping";
  case 'D':
    return "disk-sleep";
  case 'T':
    return "stopped";
  case 't':
    return "tracing-stop";
  case 'Z':
    return "zombie";
  case 'X':
  case 'x':
    return "dead";
  case 'K':
    return "wake-kill";
  case 'W':
    return "waking";
  case 'P':
    return "parked";
  case 'I':
    return "idle";
  default:
    return "unknown";
  }
}

std::vector<std::string> parse_cmdline(const std::string &raw) {
  std::vector<std::string> argv;
  std::string current;
  for (const char ch : raw) {
    if (ch == '\0') {
      argv.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!current.empty()) {
    argv.push_back(current);
  }
  return argv;
}

std::optional<std::string> decode_ipv4(const std::string &hex) {
  if (hex.size() != 8) {
    return std::nullopt;
  }
  const auto word = parse_number<std::uint32_t>(hex, 16);
  if (!word.has_value()) {
    return std::nullopt;
  }
  in_addr addr{};
  addr.s_addr = *word;
  char buf[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
    return std::nullopt;
  }
  return std::string(buf);
}

std::optional<std::string> decode_ipv6(const std::string &hex) {
  if (hex.size() != 32) {
    return std::nullopt;
  }
  in6_addr addr{};
  for (std::size_t i = 0; i < 4; ++i) {
    const auto word = parse_number<std::uint32_t>(hex.substr(i * 8, 8), 16);
    if (!word.has_value()) {
      return std::nullopt;
    }
    std::memcpy(addr.s6_addr + i * 4, &*word, sizeof(std::uint32_t));
  }
  char buf[INET6_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET6, &addr, buf, sizeof(buf)) == nullptr) {
    return std::nullopt;
  }
  return std::string(buf);
}

std::optional<std::string> decode_endpoint(const std::string &field, const bool ipv6) {
  const std::size_t colon = field.rfind(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }
  const auto port = parse_number<std::uint16_t>(field.substr(colon + 1), 16);
  if (!port.has_value() || *port == 0) {
    return std::nullopt;
  }
  const std::string hex = field.substr(0, colon);
  if (ipv6) {
    const auto ip = decode_ipv6(hex);
    if (!ip.has_value()) {
      return std::nullopt;
    }
    return "[" + *ip + "]:" + std::to_string(*port);
  }
  const auto ip = decode_ipv4(hex);
  if (!ip.has_value()) {
    return std::nullopt;
  }
  return *ip + ":" + std::to_string(*port);
}

std::optional<SocketEntry> parse_net_line(const std::string &line, const bool ipv6) {
  const auto tokens = tokenize(line);
  if (tokens.size() < 10 || !is_slot_token(tokens[0])) {
    return std::nullopt;
  }
  const auto inode = parse_number<std::uint64_t>(tokens[9]);
  if (!inode.has_value()) {
    return std::nullopt;
  }

  SocketEntry entry;
  entry.local = decode_endpoint(tokens[1], ipv6);
  entry.remote = decode_endpoint(tokens[2], ipv6);
  entry.inode = *inode;
  return entry;
}

std::optional<SocketEntry> parse_unix_line(const std::string &line) {
  const auto tokens = tokenize(line);
  if (tokens.size() < 7 || !is_slot_token(tokens[0])) {
    return std::nullopt;
  }
  const auto inode = parse_number<std::uint64_t>(tokens[6]);
  if (!inode.has_value()) {
    return std::nullopt;
  }

  SocketEntry entry;
  entry.inode = *inode;
  if (tokens.size() > 7) {
    std::vector<std::string> path(tokens.begin() + 7, tokens.end());
    entry.local = common::join(path, " ");
  }
  return entry;
}

std::vector<std::uint64_t> socket_inodes(const std::filesystem::path &proc_root, const int pid) {
  static const std::string kPrefix = "socket:[";
  std::vector<std::uint64_t> inodes;

  std::error_code ec;
  std::filesystem::directory_iterator it(proc_root / std::to_string(pid) / "fd", ec);
  if (ec) {
    return inodes;
  }
  for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code link_ec;
    const std::string target = std::filesystem::read_symlink(it->path(), link_ec).string();
    if (link_ec || !common::starts_with(target, kPrefix) || target.back() != ']') {
      continue;
    }
    const auto inode = parse_number<std::uint64_t>(
        target.substr(kPrefix.size(), target.size() - kPrefix.size() - 1));
    if (inode.has_value()) {
      inodes.push_back(*inode);
    }
  }
  return inodes;
}

std::optional<RunningTunnelProcess> read_process(const std::filesystem::path &proc_root,
                                                 const int pid) {
  const auto dir = proc_root / std::to_string(pid);
  const auto stat_content = common::read_file(dir / "stat");
  if (!stat_content.has_value()) {
    return std::nullopt;
  }
  const auto stat = parse_stat(*stat_content);
  if (!stat.has_value()) {
    return std::nullopt;
  }
  const auto cmdline = common::read_file(dir / "cmdline");
  if (!cmdline.has_value()) {
    return std::nullopt;
  }

  RunningTunnelProcess process;
  process.pid = pid;
  process.ppid = stat->ppid;
  process.name = stat->comm;
  process.argv = parse_cmdline(*cmdline);
  process.status = describe_state(stat->state);
  return process;
}

ProcessScan::ProcessScan(std::filesystem::path proc_root, std::vector<std::string> names)
    : proc_root_(std::move(proc_root)), names_(std::move(names)) {
  std::error_code ec;
  it_ = std::filesystem::directory_iterator(proc_root_, ec);
  if (ec) {
    it_ = std::filesystem::directory_iterator();
  }
}

std::optional<RunningTunnelProcess> ProcessScan::next() {
  const std::filesystem::directory_iterator end;
  while (it_ != end) {
    const std::string entry = it_->path().filename().string();
    std::error_code ec;
    it_.increment(ec);
    if (ec) {
      it_ = end;
    }

    const auto pid = parse_number<int>(entry);
    if (!pid.has_value() || *pid <= 0) {
      continue;
    }
    ++visited_;

    auto process = read_process(proc_root_, *pid);
    if (process.has_value() && wanted(process->name)) {
      return process;
    }
  }
  return std::nullopt;
}

bool ProcessScan::wanted(const std::string &name) const {
  return names_.empty() || std::find(names_.begin(), names_.end(), name) != names_.end();
}

ProcfsInspector::ProcfsInspector(std::vector<std::string> names, std::filesystem::path proc_root)
    : names_(std::move(names)), proc_root_(std::move(proc_root)) {}

std::vector<RunningTunnelProcess> ProcfsInspector::list_ssh_processes() {
  const auto started = std::chrono::steady_clock::now();
  std::vector<RunningTunnelProcess> processes;
  ProcessScan scan(proc_root_, names_);
  while (auto process = scan.next()) {
    processes.push_back(std::move(*process));
  }
  observability::record_process_scan(
      scan.visited(), std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::steady_clock::now() - started));
  return processes;
}

std::vector<std::string> ProcfsInspector::socket_connections(const RunningTunnelProcess &process,
                                                             const ConnectionKind kind) {
  const auto inode_list = socket_inodes(proc_root_, process.pid);
  if (inode_list.empty()) {
    return {};
  }
  const std::unordered_set<std::uint64_t> inodes(inode_list.begin(), inode_list.end());
  const auto net_dir = proc_root_ / std::to_string(process.pid) / "net";

  std::set<std::string> endpoints;
  const auto collect = [&](const SocketEntry &entry) {
    if (!inodes.contains(entry.inode)) {
      return;
    }
    if (entry.local.has_value() && !entry.local->empty()) {
      endpoints.insert(*entry.local);
    }
    if (entry.remote.has_value() && !entry.remote->empty()) {
      endpoints.insert(*entry.remote);
    }
  };

  for (const auto &table : tables_for(kind)) {
    const auto content = common::read_file(net_dir / table.file);
    if (!content.has_value()) {
      continue;
    }
    std::istringstream lines(*content);
    std::string line;
    while (std::getline(lines, line)) {
      if (const auto entry = parse_net_line(line, table.ipv6); entry.has_value()) {
        collect(*entry);
      }
    }
  }

  if (includes_unix(kind)) {
    if (const auto content = common::read_file(net_dir / "unix"); content.has_value()) {
      std::istringstream lines(*content);
      std::string line;
      while (std::getline(lines, line)) {
        if (const auto entry = parse_unix_line(line); entry.has_value()) {
          collect(*entry);
        }
      }
    }
  }

  return {endpoints.begin(), endpoints.end()};
}

} // namespace tunnels::process
