#pragma once

#include "conductor/common/result.hpp"
#include "conductor/health/health.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace conductor::runtime {

/// Runs `fn` every `interval` on its own thread and reports the outcome to the health
/// registry under the task's name. The first run happens one interval after start().
class PeriodicTask {
public:
  using Fn = std::function<common::Status()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval, Fn fn,
               health::HealthRegistry *health = nullptr);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask &) = delete;
  PeriodicTask &operator=(const PeriodicTask &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  /// Runs the task once on the calling thread.
  common::Status run_once();

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }
  [[nodiscard]] std::uint64_t runs() const { return runs_; }

private:
  void loop();

  std::string name_;
  std::chrono::milliseconds interval_;
  Fn fn_;
  health::HealthRegistry *health_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> runs_{0};
};

} // namespace conductor::runtime
