#pragma once

#include "conductor/common/result.hpp"
#include "conductor/common/time.hpp"
#include "conductor/sessions/persistence.hpp"
#include "conductor/sessions/session.hpp"
#include "conductor/sessions/session_events.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace conductor::sessions {

struct SessionStoreOptions {
  /// Empty keeps sessions in memory only.
  std::filesystem::path store_path;
  std::size_t log_capacity = 100;
  std::int32_t default_priority = 5;
  /// When false every mutation is written before the call returns.
  bool async_persist = true;
};

struct CreateSessionOptions {
  std::string repository;
  std::optional<std::string> branch;
  std::optional<std::int32_t> priority;
};

struct SessionFilter {
  std::vector<SessionState> states;
  std::optional<std::string> user_id;
  std::optional<std::string> repository;
  std::optional<common::TimePoint> created_after;
  std::optional<common::TimePoint> created_before;
};

struct SessionStats {
  std::size_t total = 0;
  std::map<SessionState, std::size_t> by_state;
  std::size_t active = 0;
  /// Percentage of all sessions currently in Error.
  double error_rate = 0.0;
  std::optional<double> average_duration_minutes;
};

/// Sessions keyed by thread id, with transition validation and change events. Every
/// mutation runs under one mutex; events are emitted once it is released.
class SessionStore {
public:
  SessionStore(SessionEventBus &bus, SessionStoreOptions options,
               common::Clock clock = common::system_clock());
  ~SessionStore();

  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  /// Loads the store file (if any) and starts the background writer.
  [[nodiscard]] common::Status init();
  /// Stops the background writer and writes the current state synchronously.
  [[nodiscard]] common::Status shutdown();
  [[nodiscard]] common::Status save();

  [[nodiscard]] common::Result<Session> create_session(const std::string &thread_id,
                                                       const std::string &user_id,
                                                       const std::string &guild_id,
                                                       const std::string &channel_id,
                                                       const CreateSessionOptions &options);
  [[nodiscard]] common::Result<Session> update_session(const std::string &thread_id,
                                                       const SessionUpdate &update);
  [[nodiscard]] common::Status delete_session(const std::string &thread_id);

  [[nodiscard]] std::optional<Session> get_session(const std::string &thread_id) const;
  /// Newest first.
  [[nodiscard]] std::vector<Session> list_sessions(const SessionFilter &filter = {}) const;
  [[nodiscard]] std::vector<Session> active_sessions() const;
  [[nodiscard]] SessionStats get_stats() const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] const SessionStoreOptions &options() const { return options_; }

private:
  [[nodiscard]] std::vector<Session> snapshot_locked() const;
  void persist_locked();
  void emit_all(const std::vector<SessionEvent> &events) const;

  SessionEventBus &bus_;
  SessionStoreOptions options_;
  common::Clock clock_;
  std::unique_ptr<SessionFile> file_;
  std::unique_ptr<PersistenceWriter> writer_;
  mutable std::mutex mutex_;
  std::map<std::string, Session> sessions_;
};

} // namespace conductor::sessions
