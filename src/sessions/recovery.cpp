#include "conductor/sessions/recovery.hpp"

#include "conductor/observability/global.hpp"

namespace conductor::sessions {

namespace {

std::int64_t minutes_between(const common::TimePoint from, const common::TimePoint to) {
  return std::chrono::duration_cast<std::chrono::minutes>(to - from).count();
}

} // namespace

AutoRecovery::AutoRecovery(SessionStore &store, RecoveryOptions options, common::Clock clock)
    : store_(store), options_(options), clock_(std::move(clock)) {}

RecoveryReport AutoRecovery::sweep() {
  RecoveryReport report;
  const auto now = clock_();

  for (const auto &session : store_.active_sessions()) {
    ++report.examined;
    std::optional<std::string> reason;
    if (session.state == SessionState::Initializing &&
        now - session.metadata.created_at > options_.initializing_timeout) {
      reason = "initialization timed out";
    } else if (session.state == SessionState::Starting &&
               now - session.metadata.updated_at > options_.starting_timeout) {
      reason = "startup timed out";
    } else if (session.state == SessionState::Running &&
               now - session.metadata.updated_at > options_.running_warning) {
      report.long_running.push_back(session.thread_id);
      observability::log_warn("recovery", "session " + session.id + " has been running for " +
                                              std::to_string(minutes_between(
                                                  session.metadata.updated_at, now)) +
                                              " minutes");
      continue;
    }
    if (!reason.has_value()) {
      continue;
    }

    SessionUpdate update;
    update.state = SessionState::Error;
    update.error = *reason;
    update.add_logs.push_back("auto-recovery: " + *reason);
    update.expected_state = session.state;
    update.expected_updated_at = session.metadata.updated_at;
    const auto result = store_.update_session(session.thread_id, update);
    if (!result.ok()) {
      if (result.status().code() == common::ErrorCode::Conflict ||
          result.status().code() == common::ErrorCode::NotFound) {
        // Moved on or deleted since the snapshot.
        report.skipped.push_back(session.thread_id);
        observability::log_debug("recovery", "skipped " + session.id + ": " + result.error());
        continue;
      }
      report.failures.push_back(session.thread_id + ": " + result.error());
      observability::log_warn("recovery", "could not recover " + session.id + ": " +
                                              result.error());
      continue;
    }
    report.recovered.push_back(session.thread_id);
    observability::log_warn("recovery", "session " + session.id + " moved to error: " + *reason);
  }

  observability::record_sweep("recovery", report.examined, report.recovered.size());
  return report;
}

} // namespace conductor::sessions
