#include "conductor/scheduler/scheduler.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/observability/global.hpp"

#include <algorithm>

namespace conductor::scheduler {

namespace {

std::chrono::milliseconds elapsed_ms(const common::TimePoint from, const common::TimePoint to) {
  if (to <= from) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

std::string join_ids(const std::vector<std::string> &ids) {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty()) {
      out += ", ";
    }
    out += id;
  }
  return out;
}

} // namespace

std::string_view to_string(const ContextState state) {
  switch (state) {
  case ContextState::Waiting:
    return "waiting";
  case ContextState::Running:
    return "running";
  case ContextState::Completed:
    return "completed";
  }
  return "waiting";
}

std::string_view scheduler_event_name(const SchedulerEvent::Type type) {
  switch (type) {
  case SchedulerEvent::Type::SessionQueued:
    return "session_queued";
  case SchedulerEvent::Type::SessionStarted:
    return "session_started";
  case SchedulerEvent::Type::SessionCompleted:
    return "session_completed";
  case SchedulerEvent::Type::SessionTimeout:
    return "session_timeout";
  case SchedulerEvent::Type::DeadlockDetected:
    return "deadlock_detected";
  case SchedulerEvent::Type::QueueStatusChanged:
    return "queue_status_changed";
  }
  return "queue_status_changed";
}

void Scheduler::Deferred::emit(SchedulerEventBus &bus, SchedulerEvent event) {
  actions_.push_back([&bus, event = std::move(event)]() { bus.emit(event); });
}

void Scheduler::Deferred::resolve(std::shared_ptr<std::promise<AdmissionOutcome>> promise,
                                  AdmissionOutcome outcome) {
  actions_.push_back([promise = std::move(promise), outcome = std::move(outcome)]() {
    promise->set_value(outcome);
  });
}

void Scheduler::Deferred::then(std::function<void()> action) {
  actions_.push_back(std::move(action));
}

void Scheduler::Deferred::run() {
  for (auto &action : actions_) {
    action();
  }
  actions_.clear();
}

Scheduler::Scheduler(SchedulerEventBus &bus, SchedulerOptions options, common::Clock clock)
    : bus_(bus), options_(options), clock_(std::move(clock)) {
  if (options_.max_sessions == 0) {
    options_.max_sessions = 1;
  }
}

common::Result<AdmissionTicket>
Scheduler::request_execution(const std::string &session_id,
                             const std::optional<std::int32_t> priority,
                             std::vector<std::string> dependencies) {
  using R = common::Result<AdmissionTicket>;
  if (common::trim(session_id).empty()) {
    return R::failure(common::ErrorCode::InvalidArgument, "session id is required");
  }

  const std::int32_t effective_priority = priority.value_or(options_.default_priority);
  auto promise = std::make_shared<std::promise<AdmissionOutcome>>();
  AdmissionTicket ticket(session_id, promise->get_future().share());
  Deferred deferred;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return R::failure(common::ErrorCode::Cancelled, "scheduler is shut down");
    }
    if (const auto it = contexts_.find(session_id);
        it != contexts_.end() && it->second.state != ContextState::Completed) {
      return R::failure(common::ErrorCode::AlreadyExists,
                        "session " + session_id + " is already " +
                            std::string(to_string(it->second.state)));
    }

    const auto now = clock_();
    SchedulerContext &context = contexts_[session_id];
    context = SchedulerContext{.session_id = session_id,
                               .state = ContextState::Waiting,
                               .priority = effective_priority,
                               .queued_at = now,
                               .started_at = std::nullopt,
                               .dependencies = std::move(dependencies)};

    observability::log_info("scheduler", "execution requested: " + session_id +
                                             " priority=" + std::to_string(effective_priority));

    const auto unresolved = unresolved_dependencies_locked(context);
    if (!unresolved.empty()) {
      observability::log_warn("scheduler", session_id + " waits for dependencies: " +
                                               join_ids(unresolved));
      deferred.emit(bus_, SchedulerEvent{.type = SchedulerEvent::Type::SessionQueued,
                                         .session_id = session_id,
                                         .priority = effective_priority,
                                         .reason = "dependencies",
                                         .dependencies = unresolved,
                                         .running_count = running_});
    }

    if (running_ < options_.max_sessions && unresolved.empty()) {
      start_locked(context, deferred);
      deferred.resolve(promise, AdmissionOutcome{.kind = AdmissionOutcome::Kind::Granted,
                                                 .reason = "slot available"});
      deferred.then([session_id]() {
        observability::record_admission(session_id, "granted", std::chrono::milliseconds(0));
      });
    } else {
      std::optional<common::TimePoint> deadline;
      // A timeout past the clock's range never expires.
      if (options_.queue_timeout.count() > 0 &&
          options_.queue_timeout <
              std::chrono::duration_cast<std::chrono::milliseconds>(common::TimePoint::max() -
                                                                    now)) {
        deadline = now + options_.queue_timeout;
      }
      wait_list_.insert(QueueEntry{.session_id = session_id,
                                   .priority = effective_priority,
                                   .queued_at = now,
                                   .deadline = deadline,
                                   .promise = promise});
      const int position = wait_list_.position(session_id);
      deferred.emit(bus_, SchedulerEvent{.type = SchedulerEvent::Type::SessionQueued,
                                         .session_id = session_id,
                                         .position = position,
                                         .priority = effective_priority,
                                         .running_count = running_});
      observability::log_debug("scheduler", session_id + " queued at position " +
                                                std::to_string(position));
    }
    record_metrics_locked(deferred);
  }

  deferred.run();
  return R::success(std::move(ticket));
}

void Scheduler::complete_execution(const std::string &session_id) {
  Deferred deferred;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = contexts_.find(session_id);
    if (it == contexts_.end() || it->second.state == ContextState::Completed) {
      observability::log_debug("scheduler", "completion for unknown or finished session " +
                                                session_id + " ignored");
      return;
    }

    SchedulerContext &context = it->second;
    if (context.state == ContextState::Running) {
      if (running_ > 0) {
        --running_;
      }
    } else if (auto entry = wait_list_.remove(session_id); entry.has_value()) {
      deferred.resolve(entry->promise,
                       AdmissionOutcome{.kind = AdmissionOutcome::Kind::Cancelled,
                                        .reason = "completed before admission",
                                        .waited = elapsed_ms(entry->queued_at, clock_())});
    }
    context.state = ContextState::Completed;

    observability::log_info("scheduler", "execution completed: " + session_id + " (running " +
                                             std::to_string(running_) + "/" +
                                             std::to_string(options_.max_sessions) + ")");
    deferred.emit(bus_, SchedulerEvent{.type = SchedulerEvent::Type::SessionCompleted,
                                       .session_id = session_id,
                                       .running_count = running_});
    reevaluate_locked(deferred);
    record_metrics_locked(deferred);
  }
  deferred.run();
}

void Scheduler::cancel_execution(const std::string &session_id) {
  Deferred deferred;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = contexts_.find(session_id);
    if (it == contexts_.end()) {
      return;
    }

    if (auto entry = wait_list_.remove(session_id); entry.has_value()) {
      const auto waited = elapsed_ms(entry->queued_at, clock_());
      deferred.resolve(entry->promise,
                       AdmissionOutcome{.kind = AdmissionOutcome::Kind::Cancelled,
                                        .reason = "cancelled",
                                        .waited = waited});
      deferred.then([session_id, waited]() {
        observability::record_admission(session_id, "cancelled", waited);
      });
    }
    if (it->second.state == ContextState::Running && running_ > 0) {
      --running_;
    }
    contexts_.erase(it);

    observability::log_info("scheduler", "execution cancelled: " + session_id);
    reevaluate_locked(deferred);
    record_metrics_locked(deferred);
  }
  deferred.run();
}

QueueStats Scheduler::queue_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_locked();
}

int Scheduler::queue_position(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return wait_list_.position(session_id);
}

std::optional<ContextState> Scheduler::context_state(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = contexts_.find(session_id);
  if (it == contexts_.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

std::optional<SchedulerContext> Scheduler::context(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = contexts_.find(session_id);
  if (it == contexts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t Scheduler::running_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::size_t Scheduler::expire_timeouts() {
  Deferred deferred;
  std::size_t expired = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    for (const auto &session_id : wait_list_.expired(now)) {
      auto entry = wait_list_.remove(session_id);
      if (!entry.has_value()) {
        continue;
      }
      ++expired;
      const auto waited = elapsed_ms(entry->queued_at, now);
      const std::string reason =
          "queue wait exceeded " + std::to_string(options_.queue_timeout.count() / 1000) + "s";
      deferred.resolve(entry->promise,
                       AdmissionOutcome{.kind = AdmissionOutcome::Kind::QueueTimeout,
                                        .reason = reason,
                                        .waited = waited});
      deferred.emit(bus_, SchedulerEvent{.type = SchedulerEvent::Type::SessionTimeout,
                                         .session_id = session_id,
                                         .priority = entry->priority,
                                         .running_count = running_,
                                         .timeout = options_.queue_timeout});
      deferred.then([session_id, waited]() {
        observability::record_admission(session_id, "queue_timeout", waited);
      });
      contexts_.erase(session_id);
      observability::log_warn("scheduler", session_id + ": " + reason);
    }
    if (expired > 0) {
      reevaluate_locked(deferred);
      record_metrics_locked(deferred);
    }
  }
  deferred.run();
  return expired;
}

DeadlockReport Scheduler::resolve_deadlocks(const DeadlockResolutionPolicy &policy) {
  Deferred deferred;
  DeadlockReport report;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> waiting;
    for (const auto &entry : wait_list_.entries()) {
      waiting.push_back(entry.session_id);
    }

    for (const auto &session_id : waiting) {
      auto it = contexts_.find(session_id);
      if (it == contexts_.end() || it->second.state != ContextState::Waiting) {
        continue;
      }
      ++report.examined;
      const auto cycle = find_dependency_cycle(session_id, contexts_);
      if (!cycle.has_value()) {
        continue;
      }

      ++report.deadlocks;
      SchedulerContext &context = it->second;
      observability::record_error("scheduler", "deadlock detected: " + join_ids(*cycle));
      deferred.emit(bus_, SchedulerEvent{.type = SchedulerEvent::Type::DeadlockDetected,
                                         .session_id = session_id,
                                         .priority = context.priority,
                                         .dependencies = context.dependencies,
                                         .running_count = running_});

      const auto dropped = policy.choose(context, contexts_);
      if (!dropped.has_value()) {
        continue;
      }
      auto &deps = context.dependencies;
      deps.erase(std::remove(deps.begin(), deps.end(), *dropped), deps.end());
      report.dropped.push_back(DroppedEdge{.session_id = session_id, .dependency = *dropped});
      observability::log_warn("scheduler", "deadlock resolved: dropped dependency " + *dropped +
                                               " from " + session_id + " (" +
                                               std::string(policy.name()) + ")");
    }

    if (!report.dropped.empty()) {
      reevaluate_locked(deferred);
      record_metrics_locked(deferred);
    }
  }
  deferred.run();
  observability::record_sweep("deadlock", report.examined, report.deadlocks);
  return report;
}

bool Scheduler::forget(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = contexts_.find(session_id);
  if (it == contexts_.end() || it->second.state != ContextState::Completed) {
    return false;
  }
  contexts_.erase(it);
  return true;
}

void Scheduler::shutdown() {
  Deferred deferred;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    const auto now = clock_();
    for (auto &entry : wait_list_.drain()) {
      deferred.resolve(entry.promise,
                       AdmissionOutcome{.kind = AdmissionOutcome::Kind::Cancelled,
                                        .reason = "scheduler shutting down",
                                        .waited = elapsed_ms(entry.queued_at, now)});
    }
    contexts_.clear();
    running_ = 0;
    observability::log_info("scheduler", "shut down");
    record_metrics_locked(deferred);
  }
  deferred.run();
}

bool Scheduler::is_shut_down() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shut_down_;
}

bool Scheduler::dependencies_satisfied_locked(const SchedulerContext &context) const {
  return std::all_of(context.dependencies.begin(), context.dependencies.end(),
                     [this](const std::string &dependency) {
                       const auto it = contexts_.find(dependency);
                       return it == contexts_.end() ||
                              it->second.state == ContextState::Completed;
                     });
}

std::vector<std::string>
Scheduler::unresolved_dependencies_locked(const SchedulerContext &context) const {
  std::vector<std::string> unresolved;
  for (const auto &dependency : context.dependencies) {
    const auto it = contexts_.find(dependency);
    if (it != contexts_.end() && it->second.state != ContextState::Completed) {
      unresolved.push_back(dependency);
    }
  }
  return unresolved;
}

void Scheduler::start_locked(SchedulerContext &context, Deferred &deferred) {
  ++running_;
  context.state = ContextState::Running;
  context.started_at = clock_();
  deferred.emit(bus_, SchedulerEvent{.type = SchedulerEvent::Type::SessionStarted,
                                     .session_id = context.session_id,
                                     .priority = context.priority,
                                     .running_count = running_});
  observability::log_info("scheduler", "execution started: " + context.session_id +
                                           " (running " + std::to_string(running_) + "/" +
                                           std::to_string(options_.max_sessions) + ")");
}

void Scheduler::reevaluate_locked(Deferred &deferred) {
  while (running_ < options_.max_sessions) {
    const auto &entries = wait_list_.entries();
    std::optional<std::size_t> eligible;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      const auto it = contexts_.find(entries[i].session_id);
      if (it != contexts_.end() && dependencies_satisfied_locked(it->second)) {
        eligible = i;
        break;
      }
    }
    if (!eligible.has_value()) {
      return;
    }

    QueueEntry entry = wait_list_.take_at(*eligible);
    SchedulerContext &context = contexts_[entry.session_id];
    start_locked(context, deferred);
    const auto waited = elapsed_ms(entry.queued_at, *context.started_at);
    deferred.resolve(entry.promise, AdmissionOutcome{.kind = AdmissionOutcome::Kind::Granted,
                                                     .reason = "slot released",
                                                     .waited = waited});
    deferred.then([session_id = entry.session_id, waited]() {
      observability::record_admission(session_id, "granted", waited);
    });
    deferred.emit(bus_, SchedulerEvent{.type = SchedulerEvent::Type::QueueStatusChanged,
                                       .session_id = entry.session_id,
                                       .running_count = running_,
                                       .stats = stats_locked()});
  }
}

QueueStats Scheduler::stats_locked() const {
  QueueStats stats{.running = running_,
                   .waiting = wait_list_.size(),
                   .max_sessions = options_.max_sessions};
  if (wait_list_.empty()) {
    return stats;
  }
  const auto now = clock_();
  double total = 0.0;
  for (const auto &entry : wait_list_.entries()) {
    const double seconds =
        std::chrono::duration<double>(elapsed_ms(entry.queued_at, now)).count();
    total += seconds;
    stats.max_wait_seconds = std::max(stats.max_wait_seconds, seconds);
  }
  stats.average_wait_seconds = total / static_cast<double>(wait_list_.size());
  return stats;
}

void Scheduler::record_metrics_locked(Deferred &deferred) const {
  const auto running = static_cast<std::uint64_t>(running_);
  const auto depth = static_cast<std::uint64_t>(wait_list_.size());
  deferred.then([running, depth]() {
    observability::record_metric(observability::RunningSessionsMetric{.count = running});
    observability::record_metric(observability::QueueDepthMetric{.depth = depth});
  });
}

} // namespace conductor::scheduler
