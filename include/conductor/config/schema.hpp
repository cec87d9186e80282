#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace conductor::config {

struct SchedulerConfig {
  std::int32_t max_sessions = 3;
  std::uint64_t queue_timeout_secs = 300;
  std::int32_t default_priority = 10;
  std::uint64_t deadlock_check_secs = 30;
  std::uint64_t timeout_poll_ms = 250;
  std::string deadlock_policy = "oldest";
};

struct SessionsConfig {
  std::string store_path = "~/.conductor/sessions.json";
  std::int32_t log_capacity = 100;
  std::int32_t default_priority = 5;
  std::uint64_t autosave_interval_secs = 300;
};

struct RecoveryConfig {
  bool enabled = true;
  std::uint64_t interval_secs = 600;
  std::uint64_t initializing_timeout_mins = 10;
  std::uint64_t starting_timeout_mins = 15;
  std::uint64_t running_warning_mins = 60;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  SchedulerConfig scheduler;
  SessionsConfig sessions;
  RecoveryConfig recovery;
  ObservabilityConfig observability;

  /// Keys present in the loaded file that the schema does not define.
  std::vector<std::string> unknown_keys;
};

} // namespace conductor::config
