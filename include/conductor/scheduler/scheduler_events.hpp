#pragma once

#include "conductor/events/event_bus.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace conductor::scheduler {

struct QueueStats {
  std::size_t running = 0;
  std::size_t waiting = 0;
  std::size_t max_sessions = 0;
  double average_wait_seconds = 0.0;
  double max_wait_seconds = 0.0;
};

struct SchedulerEvent {
  enum class Type {
    SessionQueued,
    SessionStarted,
    SessionCompleted,
    SessionTimeout,
    DeadlockDetected,
    QueueStatusChanged,
  };

  Type type = Type::QueueStatusChanged;
  std::string session_id;
  /// 1-indexed queue position for SessionQueued; -1 otherwise.
  int position = -1;
  std::int32_t priority = 0;
  /// "dependencies" when queued behind unfinished dependencies.
  std::string reason;
  std::vector<std::string> dependencies;
  std::size_t running_count = 0;
  QueueStats stats;
  std::chrono::milliseconds timeout{0};
};

[[nodiscard]] std::string_view scheduler_event_name(SchedulerEvent::Type type);

using SchedulerEventBus = events::EventBus<SchedulerEvent>;

} // namespace conductor::scheduler
