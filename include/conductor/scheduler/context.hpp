#pragma once

#include "conductor/common/time.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conductor::scheduler {

enum class ContextState { Waiting, Running, Completed };

[[nodiscard]] std::string_view to_string(ContextState state);

/// Scheduler-side view of a session: enough to decide admission and dependency order.
struct SchedulerContext {
  std::string session_id;
  ContextState state = ContextState::Waiting;
  std::int32_t priority = 10;
  common::TimePoint queued_at{};
  std::optional<common::TimePoint> started_at;
  std::vector<std::string> dependencies;
};

using ContextMap = std::map<std::string, SchedulerContext>;

} // namespace conductor::scheduler
