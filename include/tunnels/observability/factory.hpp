#pragma once

#include "tunnels/observability/observer.hpp"

#include <memory>
#include <string>

namespace tunnels::observability {

/// Backend names: "none"/"noop" (or empty) and "log". Unknown names fall back to log.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend);

} // namespace tunnels::observability
