#include "tunnels/tunnel/lifecycle.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/observability/global.hpp"
#include "tunnels/tunnel/identity.hpp"

#include <algorithm>
#include <chrono>

namespace tunnels::tunnel {

namespace {

constexpr const char *kNoMatch = "No tunnels found matching criteria";

template <typename Outcome>
std::string summarize_batch(const BatchReport<Outcome> &report, const std::string &past,
                            const std::string &verb) {
  switch (report.classification()) {
  case BatchClassification::Empty:
    return kNoMatch;
  case BatchClassification::FullSuccess:
    return "Successfully " + common::to_lower(past) + " " + std::to_string(report.total()) +
           " tunnel(s)";
  case BatchClassification::PartialSuccess:
    return past + " " + std::to_string(report.succeeded()) + "/" +
           std::to_string(report.total()) + " tunnel(s)";
  case BatchClassification::TotalFailure:
    return "Failed to " + verb + " any tunnels";
  }
  return kNoMatch;
}

} // namespace

std::string_view outcome_name(const StartOutcome outcome) {
  switch (outcome) {
  case StartOutcome::Started:
    return "started";
  case StartOutcome::AlreadyRunning:
    return "already-running";
  case StartOutcome::Failed:
    return "failed";
  }
  return "unknown";
}

std::string_view outcome_name(const StopOutcome outcome) {
  switch (outcome) {
  case StopOutcome::Stopped:
    return "stopped";
  case StopOutcome::ForceKilled:
    return "force-killed";
  case StopOutcome::NotRunning:
    return "not-running";
  case StopOutcome::AlreadyStopped:
    return "already-stopped";
  case StopOutcome::Failed:
    return "failed";
  }
  return "unknown";
}

std::string_view classification_name(const BatchClassification classification) {
  switch (classification) {
  case BatchClassification::Empty:
    return "empty";
  case BatchClassification::FullSuccess:
    return "full-success";
  case BatchClassification::PartialSuccess:
    return "partial-success";
  case BatchClassification::TotalFailure:
    return "total-failure";
  }
  return "unknown";
}

std::string summarize(const StartReport &report) {
  return summarize_batch(report, "Started", "start");
}

std::string summarize(const StopReport &report) {
  return summarize_batch(report, "Stopped", "stop");
}

LifecycleController::LifecycleController(std::vector<config::Tunnel> tunnels,
                                         process::IProcessInspector &inspector,
                                         IProcessControl &control,
                                         const IExecutableLocator &locator,
                                         const LifecycleOptions options)
    : tunnels_(std::move(tunnels)), inspector_(inspector), control_(control), locator_(locator),
      options_(options) {}

common::Result<std::vector<config::Tunnel>>
LifecycleController::select(const Selector &selector) const {
  using R = common::Result<std::vector<config::Tunnel>>;

  const int chosen = static_cast<int>(!selector.names.empty()) +
                     static_cast<int>(selector.group.has_value()) +
                     static_cast<int>(selector.all);
  if (chosen != 1) {
    return R::failure(common::ErrorKind::Usage,
                      "Only one of --name, --group, or --all must be specified.");
  }

  if (selector.all) {
    return R::success(tunnels_);
  }

  std::vector<config::Tunnel> out;
  if (selector.group.has_value()) {
    for (const auto &tunnel : tunnels_) {
      if (tunnel.group.has_value() && *tunnel.group == *selector.group) {
        out.push_back(tunnel);
      }
    }
    if (out.empty()) {
      return R::failure(common::ErrorKind::Usage, "Group not found: " + *selector.group);
    }
    return R::success(std::move(out));
  }

  for (const auto &name : selector.names) {
    const auto found = std::find_if(tunnels_.begin(), tunnels_.end(),
                                    [&](const config::Tunnel &t) { return t.name == name; });
    if (found == tunnels_.end()) {
      return R::failure(common::ErrorKind::Usage, "Tunnel not found: " + name);
    }
    const bool seen = std::any_of(out.begin(), out.end(),
                                  [&](const config::Tunnel &t) { return t.name == name; });
    if (!seen) {
      out.push_back(*found);
    }
  }
  return R::success(std::move(out));
}

StartReport LifecycleController::start(const std::vector<config::Tunnel> &tunnels,
                                       const bool use_autossh) {
  StartReport report;
  if (tunnels.empty()) {
    return report;
  }

  bool autossh = use_autossh;
  if (autossh && !autossh_available(locator_)) {
    report.warnings.emplace_back("AutoSSH not found, using regular SSH");
    autossh = false;
  }

  const auto processes = inspector_.list_ssh_processes();
  for (const auto &tunnel : tunnels) {
    BatchItem<StartOutcome> item{.tunnel = tunnel.name, .outcome = StartOutcome::Failed};

    const auto running = find_tagged(processes, tag(tunnel.name));
    if (running.has_value()) {
      item.outcome = StartOutcome::AlreadyRunning;
      item.pid = running->pid;
      observability::record_tunnel_skipped(tunnel.name, "already running");
      report.items.push_back(std::move(item));
      continue;
    }

    const auto command = build_start_command(tunnel, autossh, locator_);
    item.launcher = command.launcher;
    const auto spawned = control_.spawn_detached(command.argv, options_.spawn_grace);
    if (!spawned.ok()) {
      item.message = spawned.error();
      observability::record_tunnel_failed(tunnel.name, "start", spawned.error());
    } else {
      // Both launchers run with -f and fork into the background, so the
      // spawned pid has already exited. The daemon's pid is left unknown.
      item.outcome = StartOutcome::Started;
      observability::record_tunnel_started(tunnel.name, command.launcher, 0);
    }
    report.items.push_back(std::move(item));
  }
  return report;
}

StopReport LifecycleController::stop(const std::vector<config::Tunnel> &tunnels) {
  StopReport report;
  if (tunnels.empty()) {
    return report;
  }

  const auto processes = inspector_.list_ssh_processes();
  for (const auto &tunnel : tunnels) {
    const auto family = tagged(processes, tag(tunnel.name));
    if (family.empty()) {
      report.items.push_back(
          BatchItem<StopOutcome>{.tunnel = tunnel.name, .outcome = StopOutcome::NotRunning});
      observability::record_tunnel_skipped(tunnel.name, "not running");
      continue;
    }
    report.items.push_back(stop_one(tunnel, family));
  }
  return report;
}

BatchItem<StopOutcome>
LifecycleController::stop_one(const config::Tunnel &tunnel,
                              const std::vector<process::RunningTunnelProcess> &family) {
  const auto in_family = [&family](const int pid) {
    return std::any_of(family.begin(), family.end(),
                       [pid](const process::RunningTunnelProcess &p) { return p.pid == pid; });
  };

  // Roots are signalled with SIGTERM; autossh passes it on to its ssh child.
  std::vector<int> roots;
  for (const auto &process : family) {
    if (!in_family(process.ppid)) {
      roots.push_back(process.pid);
    }
  }
  if (roots.empty()) {
    roots.push_back(family.front().pid);
  }

  BatchItem<StopOutcome> item{
      .tunnel = tunnel.name, .outcome = StopOutcome::Failed, .pid = roots.front()};

  bool delivered = false;
  for (const int pid : roots) {
    switch (control_.terminate(pid)) {
    case SignalResult::Delivered:
      delivered = true;
      break;
    case SignalResult::NoSuchProcess:
      break;
    case SignalResult::AccessDenied:
      item.message = "permission denied sending SIGTERM to " + std::to_string(pid);
      observability::record_tunnel_failed(tunnel.name, "stop", item.message);
      return item;
    }
  }
  if (!delivered) {
    item.outcome = StopOutcome::AlreadyStopped;
    observability::record_tunnel_skipped(tunnel.name, "already stopped");
    return item;
  }

  const auto deadline = std::chrono::steady_clock::now() + options_.stop_timeout;
  std::vector<int> survivors;
  for (const auto &process : family) {
    const auto remaining = std::max(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                              std::chrono::steady_clock::now()),
        std::chrono::milliseconds(0));
    if (!control_.wait_exit(process.pid, remaining)) {
      survivors.push_back(process.pid);
    }
  }
  if (survivors.empty()) {
    item.outcome = StopOutcome::Stopped;
    observability::record_tunnel_stopped(tunnel.name, item.pid, false);
    return item;
  }

  bool forced = false;
  for (const int pid : survivors) {
    switch (control_.kill(pid)) {
    case SignalResult::Delivered:
      forced = true;
      break;
    case SignalResult::NoSuchProcess:
      break;
    case SignalResult::AccessDenied:
      if (item.message.empty()) {
        item.message = "permission denied sending SIGKILL to " + std::to_string(pid);
      }
      break;
    }
  }
  if (!item.message.empty()) {
    observability::record_tunnel_failed(tunnel.name, "stop", item.message);
    return item;
  }

  for (const int pid : survivors) {
    if (!control_.wait_exit(pid, options_.kill_timeout)) {
      item.message = "process " + std::to_string(pid) + " survived SIGKILL";
      observability::record_tunnel_failed(tunnel.name, "stop", item.message);
      return item;
    }
  }

  item.outcome = forced ? StopOutcome::ForceKilled : StopOutcome::Stopped;
  observability::record_tunnel_stopped(tunnel.name, item.pid, forced);
  return item;
}

} // namespace tunnels::tunnel
