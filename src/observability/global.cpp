#include "tunnels/observability/global.hpp"

#include <mutex>

namespace tunnels::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    g_observer.swap(observer);
  }
  if (observer) {
    observer->flush();
  }
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_tunnel_started(const std::string &tunnel, const std::string &launcher, const int pid) {
  record_event(TunnelStartedEvent{.tunnel = tunnel, .launcher = launcher, .pid = pid});
}

void record_tunnel_skipped(const std::string &tunnel, const std::string &reason) {
  record_event(TunnelSkippedEvent{.tunnel = tunnel, .reason = reason});
}

void record_tunnel_stopped(const std::string &tunnel, const int pid, const bool forced) {
  record_event(TunnelStoppedEvent{.tunnel = tunnel, .pid = pid, .forced = forced});
}

void record_tunnel_failed(const std::string &tunnel, const std::string &operation,
                          const std::string &message) {
  record_event(
      TunnelFailedEvent{.tunnel = tunnel, .operation = operation, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_process_scan(const std::size_t processes, const std::chrono::microseconds duration) {
  record_metric(ProcessScanMetric{.processes = processes, .duration = duration});
}

} // namespace tunnels::observability
