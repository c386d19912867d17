#include "tunnels/observability/factory.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/observability/log_observer.hpp"
#include "tunnels/observability/noop_observer.hpp"

namespace tunnels::observability {

std::unique_ptr<IObserver> create_observer(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty() || normalized == "none" || normalized == "noop") {
    return std::make_unique<NoopObserver>();
  }

  return std::make_unique<LogObserver>();
}

} // namespace tunnels::observability
