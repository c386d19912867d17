#pragma once

#include "tunnels/common/result.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace tunnels::tunnel {

enum class SignalResult {
  Delivered,
  NoSuchProcess,
  AccessDenied,
};

[[nodiscard]] std::string_view signal_result_name(SignalResult result);

/// OS spawn and signal boundary used by the lifecycle controller.
class IProcessControl {
public:
  virtual ~IProcessControl() = default;

  /// Start `argv` detached from the terminal. Fails when the executable
  /// cannot be run or the process exits non-zero within `grace`.
  [[nodiscard]] virtual common::Result<pid_t> spawn_detached(const std::vector<std::string> &argv,
                                                             std::chrono::milliseconds grace) = 0;
  [[nodiscard]] virtual SignalResult terminate(pid_t pid) = 0;
  [[nodiscard]] virtual SignalResult kill(pid_t pid) = 0;

  /// Poll until the process is gone or a zombie. False on timeout.
  [[nodiscard]] virtual bool wait_exit(pid_t pid, std::chrono::milliseconds timeout) = 0;
};

class PosixProcessControl final : public IProcessControl {
public:
  explicit PosixProcessControl(
      std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));

  [[nodiscard]] common::Result<pid_t> spawn_detached(const std::vector<std::string> &argv,
                                                     std::chrono::milliseconds grace) override;
  [[nodiscard]] SignalResult terminate(pid_t pid) override;
  [[nodiscard]] SignalResult kill(pid_t pid) override;
  [[nodiscard]] bool wait_exit(pid_t pid, std::chrono::milliseconds timeout) override;

private:
  std::chrono::milliseconds poll_interval_;
};

} // namespace tunnels::tunnel
