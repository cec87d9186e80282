#include "conductor/runtime/app.hpp"

#include "conductor/config/config.hpp"
#include "conductor/observability/global.hpp"

namespace conductor::runtime {

namespace {

sessions::SessionStoreOptions store_options(const config::Config &config) {
  sessions::SessionStoreOptions options;
  options.store_path = config.sessions.store_path;
  options.log_capacity = static_cast<std::size_t>(config.sessions.log_capacity);
  options.default_priority = config.sessions.default_priority;
  options.async_persist = true;
  return options;
}

scheduler::SchedulerOptions scheduler_options(const config::Config &config) {
  return scheduler::SchedulerOptions{
      .max_sessions = static_cast<std::size_t>(config.scheduler.max_sessions),
      .queue_timeout = std::chrono::seconds(config.scheduler.queue_timeout_secs),
      .default_priority = config.scheduler.default_priority,
  };
}

sessions::RecoveryOptions recovery_options(const config::Config &config) {
  return sessions::RecoveryOptions{
      .initializing_timeout = std::chrono::minutes(config.recovery.initializing_timeout_mins),
      .starting_timeout = std::chrono::minutes(config.recovery.starting_timeout_mins),
      .running_warning = std::chrono::minutes(config.recovery.running_warning_mins),
  };
}

} // namespace

common::Result<std::unique_ptr<Runtime>> Runtime::create(config::Config config,
                                                         common::Clock clock) {
  using R = common::Result<std::unique_ptr<Runtime>>;
  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return R::failure(validated.status());
  }
  for (const auto &warning : validated.value()) {
    observability::log_warn("config", warning);
  }

  auto policy = scheduler::make_deadlock_policy(config.scheduler.deadlock_policy);
  if (!policy.ok()) {
    return R::failure(policy.status());
  }
  return R::success(std::unique_ptr<Runtime>(
      new Runtime(std::move(config), std::move(clock), std::move(policy.value()))));
}

Runtime::Runtime(config::Config config, common::Clock clock,
                 std::unique_ptr<scheduler::DeadlockResolutionPolicy> policy)
    : config_(std::move(config)), clock_(std::move(clock)), health_(clock_) {
  store_ = std::make_unique<sessions::SessionStore>(session_events_, store_options(config_),
                                                    clock_);
  scheduler_ = std::make_unique<scheduler::Scheduler>(scheduler_events_,
                                                      scheduler_options(config_), clock_);
  recovery_ =
      std::make_unique<sessions::AutoRecovery>(*store_, recovery_options(config_), clock_);
  detector_ = std::make_unique<scheduler::DeadlockDetector>(*scheduler_, std::move(policy));
  wire_events();
  build_tasks();
}

Runtime::~Runtime() {
  if (running_) {
    if (const auto status = stop(); !status.ok()) {
      observability::record_error("runtime", "stop failed: " + status.error());
    }
  }
}

void Runtime::wire_events() {
  // A session that reaches a terminal state releases its scheduler slot; a deleted one
  // withdraws any pending admission.
  session_events_.on(sessions::SessionEvent::Type::StateChanged,
                     [this](const sessions::SessionEvent &event) {
                       if (sessions::is_terminal(event.session.state)) {
                         scheduler_->complete_execution(event.session.id);
                       }
                       observability::record_metric(observability::ActiveSessionsMetric{
                           .count = store_->active_sessions().size()});
                     });
  session_events_.on(sessions::SessionEvent::Type::Deleted,
                     [this](const sessions::SessionEvent &event) {
                       scheduler_->cancel_execution(event.session.id);
                     });
}

void Runtime::build_tasks() {
  tasks_.push_back(std::make_unique<PeriodicTask>(
      "scheduler.timeouts", std::chrono::milliseconds(config_.scheduler.timeout_poll_ms),
      [this]() {
        (void)scheduler_->expire_timeouts();
        return common::Status::success();
      },
      &health_));

  tasks_.push_back(std::make_unique<PeriodicTask>(
      "scheduler.deadlocks", std::chrono::seconds(config_.scheduler.deadlock_check_secs),
      [this]() {
        (void)detector_->sweep();
        return common::Status::success();
      },
      &health_));

  tasks_.push_back(std::make_unique<PeriodicTask>(
      "sessions.autosave", std::chrono::seconds(config_.sessions.autosave_interval_secs),
      [this]() { return store_->save(); }, &health_));

  if (config_.recovery.enabled) {
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "sessions.recovery", std::chrono::seconds(config_.recovery.interval_secs),
        [this]() {
          const auto report = recovery_->sweep();
          if (!report.failures.empty()) {
            return common::Status::error(common::ErrorCode::InvalidTransition,
                                         std::to_string(report.failures.size()) +
                                             " session(s) could not be recovered");
          }
          return common::Status::success();
        },
        &health_));
  }
}

common::Status Runtime::start() {
  if (running_) {
    return common::Status::success();
  }

  health_.mark_starting("sessions");
  if (auto status = store_->init(); !status.ok()) {
    health_.mark_error("sessions", status.error());
    return status;
  }
  health_.mark_ok("sessions");
  health_.mark_ok("scheduler");

  if (config_.recovery.enabled) {
    const auto report = recovery_->sweep();
    if (!report.recovered.empty()) {
      observability::log_info("runtime", "recovered " + std::to_string(report.recovered.size()) +
                                             " stuck session(s) at startup");
    }
  }

  for (auto &task : tasks_) {
    task->start();
  }
  running_ = true;
  observability::log_info("runtime", "started (max_sessions=" +
                                         std::to_string(scheduler_->options().max_sessions) +
                                         ", store=" + config_.sessions.store_path + ")");
  return common::Status::success();
}

common::Status Runtime::stop() {
  if (!running_) {
    return common::Status::success();
  }
  for (auto &task : tasks_) {
    task->stop();
  }
  scheduler_->shutdown();
  running_ = false;

  const auto saved = store_->shutdown();
  if (!saved.ok()) {
    health_.mark_error("sessions", saved.error());
    return saved;
  }
  observability::log_info("runtime", "stopped");
  return common::Status::success();
}

std::string Runtime::health_report_json() const {
  return health::render_report_json(health_.snapshot(), store_->get_stats(),
                                    scheduler_->queue_stats());
}

} // namespace conductor::runtime
