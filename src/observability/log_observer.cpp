#include "tunnels/observability/log_observer.hpp"

#include "tunnels/common/json_util.hpp"

#include <iostream>
#include <type_traits>

namespace tunnels::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

std::string quoted(const std::string &value) { return common::json_quote(value); }

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, TunnelStartedEvent>) {
          std::string line = "tunnel.start name=" + quoted(evt.tunnel) + " launcher=" + evt.launcher;
          if (evt.pid > 0) {
            line += " pid=" + std::to_string(evt.pid);
          }
          log_line(*out_, "INFO", line);
        } else if constexpr (std::is_same_v<T, TunnelSkippedEvent>) {
          log_line(*out_, "DEBUG",
                   "tunnel.skip name=" + quoted(evt.tunnel) + " reason=" + quoted(evt.reason));
        } else if constexpr (std::is_same_v<T, TunnelStoppedEvent>) {
          log_line(*out_, "INFO", "tunnel.stop name=" + quoted(evt.tunnel) +
                                      " pid=" + std::to_string(evt.pid) +
                                      " forced=" + (evt.forced ? std::string("true")
                                                               : std::string("false")));
        } else if constexpr (std::is_same_v<T, TunnelFailedEvent>) {
          log_line(*out_, "WARN", "tunnel." + evt.operation + ".failed name=" +
                                      quoted(evt.tunnel) + " error=" + quoted(evt.message));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(*out_, "ERROR", evt.component + " error=" + quoted(evt.message));
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ProcessScanMetric>) {
          log_line(*out_, "DEBUG", "metric.process_scan processes=" + std::to_string(m.processes) +
                                       " duration_us=" + std::to_string(m.duration.count()));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace tunnels::observability
