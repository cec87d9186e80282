#pragma once

#include "conductor/events/event_bus.hpp"
#include "conductor/sessions/session.hpp"

#include <optional>
#include <string>
#include <vector>

namespace conductor::sessions {

struct SessionEvent {
  enum class Type { Created, Updated, StateChanged, LogAdded, ErrorOccurred, Deleted };

  Type type = Type::Updated;
  std::string thread_id;
  /// Snapshot taken right after the mutation (the removed record for Deleted).
  Session session;
  std::optional<SessionState> previous_state;
  std::vector<std::string> logs;
  std::optional<std::string> error;
};

[[nodiscard]] std::string_view session_event_name(SessionEvent::Type type);

using SessionEventBus = events::EventBus<SessionEvent>;

} // namespace conductor::sessions
