#include "conductor/observability/log_observer.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace conductor::observability {

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogLevel parse_log_level(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "trace") {
    return LogLevel::Trace;
  }
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(std::cerr, min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << common::format_timestamp(common::now()) << " [" << log_level_name(level) << "] "
       << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, LogEvent>) {
          log_line(evt.level, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, AdmissionEvent>) {
          log_line(LogLevel::Info, "scheduler: admission session=" + evt.session_id +
                                       " outcome=" + evt.outcome +
                                       " waited_ms=" + std::to_string(evt.waited.count()));
        } else if constexpr (std::is_same_v<T, SessionTransitionEvent>) {
          log_line(LogLevel::Debug, "sessions: transition session=" + evt.session_id + " " +
                                        evt.from + " -> " + evt.to);
        } else if constexpr (std::is_same_v<T, SweepEvent>) {
          log_line(evt.affected > 0 ? LogLevel::Info : LogLevel::Debug,
                   evt.sweep + ": sweep examined=" + std::to_string(evt.examined) +
                       " affected=" + std::to_string(evt.affected));
        } else if constexpr (std::is_same_v<T, PersistenceEvent>) {
          if (evt.success) {
            log_line(LogLevel::Trace, "persistence: saved " + evt.path);
          } else {
            log_line(LogLevel::Error, "persistence: " + evt.path + ": " + evt.detail);
          }
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RunningSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.running_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line(LogLevel::Debug, "metric.queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, QueueWaitMetric>) {
          log_line(LogLevel::Debug, "metric.queue_wait_ms=" + std::to_string(m.wait.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace conductor::observability
