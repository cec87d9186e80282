#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace conductor::observability {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

[[nodiscard]] std::string_view log_level_name(LogLevel level);
/// Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(const std::string &name);

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

struct AdmissionEvent {
  std::string session_id;
  std::string outcome;
  std::chrono::milliseconds waited{0};
};

struct SessionTransitionEvent {
  std::string session_id;
  std::string from;
  std::string to;
};

struct SweepEvent {
  std::string sweep;
  std::size_t examined = 0;
  std::size_t affected = 0;
};

struct PersistenceEvent {
  std::string path;
  bool success = false;
  std::string detail;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<LogEvent, AdmissionEvent, SessionTransitionEvent, SweepEvent,
                                   PersistenceEvent, ErrorEvent>;

struct RunningSessionsMetric {
  std::uint64_t count = 0;
};

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct QueueWaitMetric {
  std::chrono::milliseconds wait{0};
};

using ObserverMetric =
    std::variant<RunningSessionsMetric, QueueDepthMetric, ActiveSessionsMetric, QueueWaitMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace conductor::observability
