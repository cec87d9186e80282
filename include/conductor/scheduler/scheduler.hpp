#pragma once

#include "conductor/common/result.hpp"
#include "conductor/common/time.hpp"
#include "conductor/scheduler/admission.hpp"
#include "conductor/scheduler/context.hpp"
#include "conductor/scheduler/deadlock.hpp"
#include "conductor/scheduler/scheduler_events.hpp"
#include "conductor/scheduler/wait_list.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace conductor::scheduler {

struct SchedulerOptions {
  std::size_t max_sessions = 3;
  /// Zero disables queue timeouts.
  std::chrono::milliseconds queue_timeout{std::chrono::seconds(300)};
  std::int32_t default_priority = 10;
};

/// Bounded-concurrency admission control. At most `max_sessions` sessions run at once;
/// the rest wait in priority order until a slot frees and their dependencies complete.
///
/// Every operation runs under one mutex. Events and ticket resolutions produced by an
/// operation are delivered after the mutex is released, in production order, so event
/// handlers may call back into the scheduler.
class Scheduler {
public:
  Scheduler(SchedulerEventBus &bus, SchedulerOptions options,
            common::Clock clock = common::system_clock());

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  [[nodiscard]] common::Result<AdmissionTicket>
  request_execution(const std::string &session_id,
                    std::optional<std::int32_t> priority = std::nullopt,
                    std::vector<std::string> dependencies = {});
  void complete_execution(const std::string &session_id);
  void cancel_execution(const std::string &session_id);

  [[nodiscard]] QueueStats queue_stats() const;
  [[nodiscard]] int queue_position(const std::string &session_id) const;
  [[nodiscard]] std::optional<ContextState> context_state(const std::string &session_id) const;
  [[nodiscard]] std::optional<SchedulerContext> context(const std::string &session_id) const;
  [[nodiscard]] std::size_t running_count() const;

  /// Resolves every wait-list entry whose deadline has passed as QueueTimeout.
  std::size_t expire_timeouts();
  DeadlockReport resolve_deadlocks(const DeadlockResolutionPolicy &policy);

  /// Drops a Completed context. Waiting or running contexts are left alone.
  bool forget(const std::string &session_id);
  /// Cancels every pending ticket; later requests fail with ErrorCode::Cancelled.
  void shutdown();
  [[nodiscard]] bool is_shut_down() const;

  [[nodiscard]] const SchedulerOptions &options() const { return options_; }

private:
  /// Work collected under the mutex and run after it is released.
  class Deferred {
  public:
    void emit(SchedulerEventBus &bus, SchedulerEvent event);
    void resolve(std::shared_ptr<std::promise<AdmissionOutcome>> promise,
                 AdmissionOutcome outcome);
    void then(std::function<void()> action);
    void run();

  private:
    std::vector<std::function<void()>> actions_;
  };

  [[nodiscard]] bool dependencies_satisfied_locked(const SchedulerContext &context) const;
  [[nodiscard]] std::vector<std::string>
  unresolved_dependencies_locked(const SchedulerContext &context) const;
  void start_locked(SchedulerContext &context, Deferred &deferred);
  void reevaluate_locked(Deferred &deferred);
  [[nodiscard]] QueueStats stats_locked() const;
  void record_metrics_locked(Deferred &deferred) const;

  SchedulerEventBus &bus_;
  SchedulerOptions options_;
  common::Clock clock_;
  mutable std::mutex mutex_;
  ContextMap contexts_;
  WaitList wait_list_;
  std::size_t running_ = 0;
  bool shut_down_ = false;
};

} // namespace conductor::scheduler
