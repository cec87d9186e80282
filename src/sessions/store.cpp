#include "conductor/sessions/store.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/observability/global.hpp"

#include <algorithm>

namespace conductor::sessions {

std::string_view session_event_name(const SessionEvent::Type type) {
  switch (type) {
  case SessionEvent::Type::Created:
    return "created";
  case SessionEvent::Type::Updated:
    return "updated";
  case SessionEvent::Type::StateChanged:
    return "state_changed";
  case SessionEvent::Type::LogAdded:
    return "log_added";
  case SessionEvent::Type::ErrorOccurred:
    return "error_occurred";
  case SessionEvent::Type::Deleted:
    return "deleted";
  }
  return "updated";
}

namespace {

bool matches(const Session &session, const SessionFilter &filter) {
  if (!filter.states.empty() &&
      std::find(filter.states.begin(), filter.states.end(), session.state) ==
          filter.states.end()) {
    return false;
  }
  if (filter.user_id.has_value() && session.metadata.user_id != *filter.user_id) {
    return false;
  }
  if (filter.repository.has_value() && session.repository != *filter.repository) {
    return false;
  }
  if (filter.created_after.has_value() && session.metadata.created_at < *filter.created_after) {
    return false;
  }
  if (filter.created_before.has_value() &&
      session.metadata.created_at > *filter.created_before) {
    return false;
  }
  return true;
}

} // namespace

SessionStore::SessionStore(SessionEventBus &bus, SessionStoreOptions options,
                           common::Clock clock)
    : bus_(bus), options_(std::move(options)), clock_(std::move(clock)) {
  if (options_.log_capacity == 0) {
    options_.log_capacity = 1;
  }
  if (!options_.store_path.empty()) {
    file_ = std::make_unique<SessionFile>(options_.store_path);
    writer_ = std::make_unique<PersistenceWriter>(*file_, clock_);
  }
}

SessionStore::~SessionStore() {
  if (writer_) {
    writer_->stop();
  }
}

common::Status SessionStore::init() {
  if (!file_) {
    return common::Status::success();
  }
  auto loaded = file_->load();
  if (!loaded.ok()) {
    return loaded.status();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
    for (auto &session : loaded.value()) {
      if (session.logs.size() > options_.log_capacity) {
        session.logs.erase(session.logs.begin(),
                           session.logs.end() -
                               static_cast<std::ptrdiff_t>(options_.log_capacity));
      }
      const std::string key = session.thread_id;
      sessions_[key] = std::move(session);
    }
  }

  observability::log_info("sessions", "loaded " + std::to_string(loaded.value().size()) +
                                          " session(s) from " + file_->path().string());
  if (options_.async_persist) {
    writer_->start();
  }
  return common::Status::success();
}

common::Status SessionStore::shutdown() {
  if (!file_) {
    return common::Status::success();
  }
  writer_->stop();
  return save();
}

common::Status SessionStore::save() {
  if (!writer_) {
    return common::Status::success();
  }
  std::uint64_t sequence = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sequence = writer_->schedule(snapshot_locked());
  }
  return writer_->wait_for(sequence);
}

common::Result<Session> SessionStore::create_session(const std::string &thread_id,
                                                     const std::string &user_id,
                                                     const std::string &guild_id,
                                                     const std::string &channel_id,
                                                     const CreateSessionOptions &options) {
  using R = common::Result<Session>;
  if (common::trim(thread_id).empty()) {
    return R::failure(common::ErrorCode::InvalidArgument, "thread id is required");
  }
  if (common::trim(options.repository).empty()) {
    return R::failure(common::ErrorCode::InvalidArgument, "repository is required");
  }

  Session created;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.contains(thread_id)) {
      return R::failure(common::ErrorCode::AlreadyExists,
                        "Session already exists for thread " + thread_id);
    }

    const auto now = clock_();
    auto id = generate_session_id(now);
    if (!id.ok()) {
      return R::failure(id.status());
    }

    created.id = id.value();
    created.thread_id = thread_id;
    created.repository = options.repository;
    created.branch = options.branch;
    created.state = SessionState::Initializing;
    created.metadata = SessionMetadata{
        .user_id = user_id,
        .guild_id = guild_id,
        .channel_id = channel_id,
        .created_at = now,
        .updated_at = now,
        .priority = options.priority.value_or(options_.default_priority),
    };
    sessions_[thread_id] = created;
    persist_locked();
  }

  observability::log_info("sessions", "created " + created.id + " for thread " + thread_id +
                                          " (" + created.repository + ")");
  emit_all({SessionEvent{.type = SessionEvent::Type::Created,
                         .thread_id = thread_id,
                         .session = created}});
  return R::success(std::move(created));
}

common::Result<Session> SessionStore::update_session(const std::string &thread_id,
                                                     const SessionUpdate &update) {
  using R = common::Result<Session>;
  std::vector<SessionEvent> events;
  Session updated;
  std::optional<SessionState> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(thread_id);
    if (it == sessions_.end()) {
      return R::failure(common::ErrorCode::NotFound, "Session not found: " + thread_id);
    }
    Session &session = it->second;

    if (update.expected_state.has_value() && *update.expected_state != session.state) {
      return R::failure(common::ErrorCode::Conflict,
                        "Session " + thread_id + " is " + std::string(to_string(session.state)) +
                            ", expected " + std::string(to_string(*update.expected_state)));
    }
    if (update.expected_updated_at.has_value() &&
        *update.expected_updated_at != session.metadata.updated_at) {
      return R::failure(common::ErrorCode::Conflict,
                        "Session " + thread_id + " was updated since it was read");
    }

    if (update.state.has_value() && *update.state != session.state) {
      if (!can_transition(session.state, *update.state)) {
        return R::failure(common::ErrorCode::InvalidTransition,
                          "Invalid state transition from " +
                              std::string(to_string(session.state)) + " to " +
                              std::string(to_string(*update.state)));
      }
      previous = session.state;
      session.state = *update.state;
    }

    bool error_changed = false;
    if (update.error.has_value() && session.error != update.error) {
      session.error = update.error;
      error_changed = true;
    }
    if (update.worktree_path.has_value()) {
      session.worktree_path = update.worktree_path;
    }
    if (update.container_id.has_value()) {
      session.container_id = update.container_id;
    }
    if (update.clear_logs) {
      session.logs.clear();
    }
    if (!update.add_logs.empty()) {
      session.logs.insert(session.logs.end(), update.add_logs.begin(), update.add_logs.end());
      if (session.logs.size() > options_.log_capacity) {
        session.logs.erase(session.logs.begin(),
                           session.logs.end() -
                               static_cast<std::ptrdiff_t>(options_.log_capacity));
      }
    }
    session.metadata.updated_at = clock_();
    updated = session;
    persist_locked();

    events.push_back(SessionEvent{.type = SessionEvent::Type::Updated,
                                  .thread_id = thread_id,
                                  .session = updated});
    if (previous.has_value()) {
      events.push_back(SessionEvent{.type = SessionEvent::Type::StateChanged,
                                    .thread_id = thread_id,
                                    .session = updated,
                                    .previous_state = previous});
    }
    if (!update.add_logs.empty()) {
      events.push_back(SessionEvent{.type = SessionEvent::Type::LogAdded,
                                    .thread_id = thread_id,
                                    .session = updated,
                                    .logs = update.add_logs});
    }
    if (error_changed) {
      events.push_back(SessionEvent{.type = SessionEvent::Type::ErrorOccurred,
                                    .thread_id = thread_id,
                                    .session = updated,
                                    .error = updated.error});
    }
  }

  if (previous.has_value()) {
    observability::record_transition(updated.id, std::string(to_string(*previous)),
                                     std::string(to_string(updated.state)));
  }
  emit_all(events);
  return R::success(std::move(updated));
}

common::Status SessionStore::delete_session(const std::string &thread_id) {
  Session removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(thread_id);
    if (it == sessions_.end()) {
      return common::Status::error(common::ErrorCode::NotFound,
                                   "Session not found: " + thread_id);
    }
    removed = std::move(it->second);
    sessions_.erase(it);
    persist_locked();
  }

  observability::log_info("sessions", "deleted " + removed.id);
  emit_all({SessionEvent{.type = SessionEvent::Type::Deleted,
                         .thread_id = thread_id,
                         .session = removed}});
  return common::Status::success();
}

std::optional<Session> SessionStore::get_session(const std::string &thread_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(thread_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Session> SessionStore::list_sessions(const SessionFilter &filter) const {
  std::vector<Session> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[thread_id, session] : sessions_) {
      if (matches(session, filter)) {
        out.push_back(session);
      }
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const Session &a, const Session &b) {
    return a.metadata.created_at > b.metadata.created_at;
  });
  return out;
}

std::vector<Session> SessionStore::active_sessions() const {
  std::vector<Session> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[thread_id, session] : sessions_) {
    if (is_active(session.state)) {
      out.push_back(session);
    }
  }
  return out;
}

SessionStats SessionStore::get_stats() const {
  SessionStats stats;
  for (const auto state : all_session_states()) {
    stats.by_state[state] = 0;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  stats.total = sessions_.size();
  double completed_minutes = 0.0;
  std::size_t completed = 0;
  for (const auto &[thread_id, session] : sessions_) {
    ++stats.by_state[session.state];
    if (is_active(session.state)) {
      ++stats.active;
    }
    if (session.state == SessionState::Completed) {
      const auto elapsed = session.metadata.updated_at - session.metadata.created_at;
      completed_minutes += std::chrono::duration<double, std::ratio<60>>(elapsed).count();
      ++completed;
    }
  }
  if (stats.total > 0) {
    stats.error_rate = static_cast<double>(stats.by_state[SessionState::Error]) * 100.0 /
                       static_cast<double>(stats.total);
  }
  if (completed > 0) {
    stats.average_duration_minutes = completed_minutes / static_cast<double>(completed);
  }
  return stats;
}

std::size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<Session> SessionStore::snapshot_locked() const {
  std::vector<Session> snapshot;
  snapshot.reserve(sessions_.size());
  for (const auto &[thread_id, session] : sessions_) {
    snapshot.push_back(session);
  }
  return snapshot;
}

void SessionStore::persist_locked() {
  if (writer_) {
    writer_->schedule(snapshot_locked());
  }
}

void SessionStore::emit_all(const std::vector<SessionEvent> &events) const {
  for (const auto &event : events) {
    bus_.emit(event);
  }
}

} // namespace conductor::sessions
