#pragma once

#include "conductor/config/schema.hpp"
#include "conductor/observability/observer.hpp"

#include <memory>

namespace conductor::observability {

/// Returns nullptr for the "none" backend.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace conductor::observability
