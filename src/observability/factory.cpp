#include "conductor/observability/factory.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/observability/log_observer.hpp"

namespace conductor::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return nullptr;
  }
  return std::make_unique<LogObserver>(parse_log_level(config.observability.level));
}

} // namespace conductor::observability
