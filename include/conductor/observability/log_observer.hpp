#pragma once

#include "conductor/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace conductor::observability {

/// Writes one `[LEVEL] component: message` line per event. Metrics are logged at Debug.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(std::ostream &out, LogLevel min_level);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  std::ostream &out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace conductor::observability
