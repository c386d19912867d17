#include "test_helpers.hpp"

#include "tunnels/config/config.hpp"
#include "tunnels/tunnel/identity.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <random>

namespace tunnels::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("tunnels-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
  old_override = config::config_path_override();
  if (next.has_value()) {
    config::set_config_path_override(*next);
  } else {
    config::clear_config_path_override();
  }
}

ConfigOverrideGuard::~ConfigOverrideGuard() {
  if (old_override.has_value()) {
    config::set_config_path_override(*old_override);
  } else {
    config::clear_config_path_override();
  }
}

config::Tunnel local_tunnel(const std::string &name, const std::optional<std::string> &group) {
  config::Local local;
  local.port = 8080;
  local.host = "db.internal";
  local.host_port = 5432;
  return config::Tunnel{
      .name = name, .group = group, .hostname = "bastion.example.com", .forwarding = local};
}

config::Tunnel dynamic_tunnel(const std::string &name, const std::uint16_t port) {
  config::Dynamic dynamic;
  dynamic.port = port;
  return config::Tunnel{
      .name = name, .group = std::nullopt, .hostname = "jump", .forwarding = dynamic};
}

process::RunningTunnelProcess tagged_process(const std::string &tunnel_name, const int pid,
                                             const int ppid, const std::string &name) {
  process::RunningTunnelProcess process;
  process.pid = pid;
  process.ppid = ppid;
  process.name = name;
  process.argv = {name, "-f", "-N", "-n", "bastion.example.com", "-o",
                  "Tag=" + tunnel::tag(tunnel_name)};
  process.status = "sleeping";
  return process;
}

std::vector<process::RunningTunnelProcess> FakeInspector::list_ssh_processes() {
  ++list_calls;
  return processes;
}

std::vector<std::string> FakeInspector::socket_connections(const process::RunningTunnelProcess &process,
                                                           const process::ConnectionKind kind) {
  (void)kind;
  const auto it = endpoints.find(process.pid);
  if (it == endpoints.end()) {
    return {};
  }
  return it->second;
}

void FakeInspector::remove(const int pid) {
  processes.erase(std::remove_if(processes.begin(), processes.end(),
                                 [pid](const process::RunningTunnelProcess &p) {
                                   return p.pid == pid;
                                 }),
                  processes.end());
}

common::Result<pid_t> FakeProcessControl::spawn_detached(const std::vector<std::string> &argv,
                                                         const std::chrono::milliseconds grace) {
  (void)grace;
  spawned.push_back(argv);
  if (spawn_error.has_value()) {
    return common::Result<pid_t>::failure(common::ErrorKind::Spawn, *spawn_error);
  }
  process::RunningTunnelProcess process;
  process.pid = next_pid++;
  process.ppid = 1;
  process.name = argv.empty() ? "ssh" : std::filesystem::path(argv.front()).filename().string();
  process.argv = argv;
  process.status = "sleeping";
  inspector_.processes.push_back(process);
  return common::Result<pid_t>::success(process.pid);
}

tunnel::SignalResult FakeProcessControl::terminate(const pid_t pid) {
  terminated.push_back(pid);
  if (vanished.contains(pid)) {
    return tunnel::SignalResult::NoSuchProcess;
  }
  if (deny_terminate.contains(pid)) {
    return tunnel::SignalResult::AccessDenied;
  }
  if (ignore_terminate.contains(pid)) {
    return tunnel::SignalResult::Delivered;
  }
  std::vector<int> children;
  for (const auto &process : inspector_.processes) {
    if (process.ppid == pid && !ignore_terminate.contains(process.pid)) {
      children.push_back(process.pid);
    }
  }
  inspector_.remove(pid);
  for (const int child : children) {
    inspector_.remove(child);
  }
  return tunnel::SignalResult::Delivered;
}

tunnel::SignalResult FakeProcessControl::kill(const pid_t pid) {
  killed.push_back(pid);
  if (deny_kill.contains(pid)) {
    return tunnel::SignalResult::AccessDenied;
  }
  if (!survive_kill.contains(pid)) {
    inspector_.remove(pid);
  }
  return tunnel::SignalResult::Delivered;
}

bool FakeProcessControl::wait_exit(const pid_t pid, const std::chrono::milliseconds timeout) {
  (void)timeout;
  return std::none_of(inspector_.processes.begin(), inspector_.processes.end(),
                      [pid](const process::RunningTunnelProcess &p) { return p.pid == pid; });
}

std::optional<std::string> FakeLocator::locate(const std::string &name) const {
  const auto it = installed.find(name);
  if (it == installed.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace tunnels::testing
