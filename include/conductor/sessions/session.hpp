#pragma once

#include "conductor/common/result.hpp"
#include "conductor/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conductor::sessions {

enum class SessionState { Initializing, Starting, Ready, Running, Waiting, Completed, Error };

/// Lowercase wire name, e.g. "initializing".
[[nodiscard]] std::string_view to_string(SessionState state);
/// Human-readable label, e.g. "Initializing".
[[nodiscard]] std::string_view state_label(SessionState state);
[[nodiscard]] common::Result<SessionState> parse_session_state(const std::string &name);

[[nodiscard]] const std::vector<SessionState> &all_session_states();
[[nodiscard]] const std::vector<SessionState> &allowed_transitions(SessionState from);
[[nodiscard]] bool can_transition(SessionState from, SessionState to);
[[nodiscard]] bool is_terminal(SessionState state);
[[nodiscard]] bool is_active(SessionState state);

struct SessionMetadata {
  std::string user_id;
  std::string guild_id;
  std::string channel_id;
  common::TimePoint created_at{};
  common::TimePoint updated_at{};
  std::int32_t priority = 5;
};

struct Session {
  std::string id;
  std::string thread_id;
  std::string repository;
  std::optional<std::string> branch;
  SessionState state = SessionState::Initializing;
  std::optional<std::string> worktree_path;
  std::optional<std::string> container_id;
  std::optional<std::string> error;
  std::vector<std::string> logs;
  SessionMetadata metadata;
};

/// Fields left unset are not touched. Logs are cleared before `add_logs` is appended.
struct SessionUpdate {
  std::optional<SessionState> state;
  std::optional<std::string> error;
  std::optional<std::string> worktree_path;
  std::optional<std::string> container_id;
  std::vector<std::string> add_logs;
  bool clear_logs = false;
  /// Preconditions checked under the store lock; a mismatch fails with Conflict and
  /// leaves the record untouched.
  std::optional<SessionState> expected_state;
  std::optional<common::TimePoint> expected_updated_at;
};

/// `session_<epoch-ms>_<16 hex chars>`; fails only when the random source does.
[[nodiscard]] common::Result<std::string> generate_session_id(common::TimePoint at);

[[nodiscard]] std::string encode_session_json(const Session &session);
[[nodiscard]] common::Result<Session> parse_session_json(const std::string &json);

} // namespace conductor::sessions
