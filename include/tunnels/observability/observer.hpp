#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace tunnels::observability {

struct TunnelStartedEvent {
  std::string tunnel;
  std::string launcher;
  /// 0 when the launcher forked into the background and the daemon's pid is unknown.
  int pid = 0;
};

struct TunnelSkippedEvent {
  std::string tunnel;
  std::string reason;
};

struct TunnelStoppedEvent {
  std::string tunnel;
  int pid = 0;
  bool forced = false;
};

struct TunnelFailedEvent {
  std::string tunnel;
  std::string operation;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<TunnelStartedEvent, TunnelSkippedEvent, TunnelStoppedEvent,
                                   TunnelFailedEvent, ErrorEvent>;

struct ProcessScanMetric {
  std::size_t processes = 0;
  std::chrono::microseconds duration{0};
};

using ObserverMetric = std::variant<ProcessScanMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tunnels::observability
