#pragma once

#include "tunnels/observability/observer.hpp"

#include <memory>

namespace tunnels::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_tunnel_started(const std::string &tunnel, const std::string &launcher, int pid);
void record_tunnel_skipped(const std::string &tunnel, const std::string &reason);
void record_tunnel_stopped(const std::string &tunnel, int pid, bool forced);
void record_tunnel_failed(const std::string &tunnel, const std::string &operation,
                          const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_process_scan(std::size_t processes, std::chrono::microseconds duration);

} // namespace tunnels::observability
