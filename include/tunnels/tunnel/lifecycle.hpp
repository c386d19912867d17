#pragma once

#include "tunnels/common/result.hpp"
#include "tunnels/config/schema.hpp"
#include "tunnels/process/inspector.hpp"
#include "tunnels/tunnel/command.hpp"
#include "tunnels/tunnel/process.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tunnels::tunnel {

struct Selector {
  std::vector<std::string> names;
  std::optional<std::string> group;
  bool all = false;
};

struct LifecycleOptions {
  std::chrono::milliseconds stop_timeout = std::chrono::seconds(5);
  std::chrono::milliseconds spawn_grace = std::chrono::milliseconds(500);
  std::chrono::milliseconds kill_timeout = std::chrono::seconds(1);
};

enum class StartOutcome {
  Started,
  AlreadyRunning,
  Failed,
};

enum class StopOutcome {
  Stopped,
  ForceKilled,
  NotRunning,
  AlreadyStopped,
  Failed,
};

enum class BatchClassification {
  Empty,
  FullSuccess,
  PartialSuccess,
  TotalFailure,
};

[[nodiscard]] std::string_view outcome_name(StartOutcome outcome);
[[nodiscard]] std::string_view outcome_name(StopOutcome outcome);
[[nodiscard]] std::string_view classification_name(BatchClassification classification);

[[nodiscard]] constexpr bool is_failure(const StartOutcome outcome) {
  return outcome == StartOutcome::Failed;
}
[[nodiscard]] constexpr bool is_failure(const StopOutcome outcome) {
  return outcome == StopOutcome::Failed;
}

template <typename Outcome> struct BatchItem {
  std::string tunnel;
  Outcome outcome;
  pid_t pid = 0;
  std::string launcher;
  std::string message;
};

template <typename Outcome> struct BatchReport {
  std::vector<BatchItem<Outcome>> items;
  std::vector<std::string> warnings;

  [[nodiscard]] std::size_t total() const { return items.size(); }

  [[nodiscard]] std::size_t succeeded() const {
    std::size_t count = 0;
    for (const auto &item : items) {
      if (!is_failure(item.outcome)) {
        ++count;
      }
    }
    return count;
  }

  [[nodiscard]] BatchClassification classification() const {
    if (items.empty()) {
      return BatchClassification::Empty;
    }
    const std::size_t ok = succeeded();
    if (ok == items.size()) {
      return BatchClassification::FullSuccess;
    }
    return ok == 0 ? BatchClassification::TotalFailure : BatchClassification::PartialSuccess;
  }
};

using StartReport = BatchReport<StartOutcome>;
using StopReport = BatchReport<StopOutcome>;

/// `Successfully started N tunnel(s)`, `Started k/N tunnel(s)`, ...
[[nodiscard]] std::string summarize(const StartReport &report);
[[nodiscard]] std::string summarize(const StopReport &report);

class LifecycleController {
public:
  LifecycleController(std::vector<config::Tunnel> tunnels, process::IProcessInspector &inspector,
                      IProcessControl &control, const IExecutableLocator &locator,
                      LifecycleOptions options = {});

  /// Exactly one of names, group or all must be set. Unknown names or groups
  /// are usage errors; repeated names are selected once.
  [[nodiscard]] common::Result<std::vector<config::Tunnel>> select(const Selector &selector) const;

  /// Start every tunnel that is not already running. One process-table read
  /// serves the whole batch.
  [[nodiscard]] StartReport start(const std::vector<config::Tunnel> &tunnels, bool use_autossh);

  /// SIGTERM to each root of the tunnel's tagged process tree, wait up to
  /// stop_timeout for every tagged process, then SIGKILL the survivors. The
  /// stop only succeeds once no tagged process remains.
  [[nodiscard]] StopReport stop(const std::vector<config::Tunnel> &tunnels);

  [[nodiscard]] const std::vector<config::Tunnel> &tunnels() const { return tunnels_; }

private:
  [[nodiscard]] BatchItem<StopOutcome>
  stop_one(const config::Tunnel &tunnel, const std::vector<process::RunningTunnelProcess> &family);

  std::vector<config::Tunnel> tunnels_;
  process::IProcessInspector &inspector_;
  IProcessControl &control_;
  const IExecutableLocator &locator_;
  LifecycleOptions options_;
};

} // namespace tunnels::tunnel
