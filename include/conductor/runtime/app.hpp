#pragma once

#include "conductor/common/result.hpp"
#include "conductor/common/time.hpp"
#include "conductor/config/schema.hpp"
#include "conductor/health/health.hpp"
#include "conductor/runtime/periodic.hpp"
#include "conductor/scheduler/deadlock.hpp"
#include "conductor/scheduler/scheduler.hpp"
#include "conductor/sessions/recovery.hpp"
#include "conductor/sessions/store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace conductor::runtime {

/// Owns every long-lived component and the background tasks that drive them. One instance
/// per process, passed by reference to whatever needs it.
class Runtime {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<Runtime>>
  create(config::Config config, common::Clock clock = common::system_clock());

  ~Runtime();

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  /// Loads the session store (fatal on a corrupt file), runs one recovery sweep, then
  /// starts the periodic tasks.
  [[nodiscard]] common::Status start();
  /// Stops the tasks, cancels pending admissions and saves the store synchronously.
  [[nodiscard]] common::Status stop();
  [[nodiscard]] bool is_running() const { return running_; }

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] scheduler::Scheduler &scheduler() { return *scheduler_; }
  [[nodiscard]] sessions::SessionStore &store() { return *store_; }
  [[nodiscard]] scheduler::SchedulerEventBus &scheduler_events() { return scheduler_events_; }
  [[nodiscard]] sessions::SessionEventBus &session_events() { return session_events_; }
  [[nodiscard]] health::HealthRegistry &health() { return health_; }
  [[nodiscard]] sessions::AutoRecovery &recovery() { return *recovery_; }
  [[nodiscard]] scheduler::DeadlockDetector &deadlock_detector() { return *detector_; }
  [[nodiscard]] const std::vector<std::unique_ptr<PeriodicTask>> &tasks() const {
    return tasks_;
  }

  [[nodiscard]] std::string health_report_json() const;

private:
  Runtime(config::Config config, common::Clock clock,
          std::unique_ptr<scheduler::DeadlockResolutionPolicy> policy);

  void wire_events();
  void build_tasks();

  config::Config config_;
  common::Clock clock_;
  health::HealthRegistry health_;
  scheduler::SchedulerEventBus scheduler_events_;
  sessions::SessionEventBus session_events_;
  std::unique_ptr<sessions::SessionStore> store_;
  std::unique_ptr<scheduler::Scheduler> scheduler_;
  std::unique_ptr<sessions::AutoRecovery> recovery_;
  std::unique_ptr<scheduler::DeadlockDetector> detector_;
  std::vector<std::unique_ptr<PeriodicTask>> tasks_;
  bool running_ = false;
};

} // namespace conductor::runtime
