#pragma once

#include "conductor/common/result.hpp"
#include "conductor/runtime/app.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>

namespace conductor::daemon {

struct DaemonOptions {
  /// Stop after this long instead of waiting for SIGINT/SIGTERM.
  std::optional<std::chrono::seconds> duration;
  /// Directory for daemon.pid and daemon_state.json; defaults to the config directory.
  std::filesystem::path state_dir;
  std::chrono::milliseconds state_interval{std::chrono::seconds(5)};
  bool install_signal_handlers = true;
};

class Daemon {
public:
  explicit Daemon(runtime::Runtime &runtime);
  ~Daemon();

  /// Starts the runtime and blocks until a stop is requested, then shuts down and saves.
  [[nodiscard]] common::Status run(const DaemonOptions &options);
  void request_stop();
  [[nodiscard]] bool is_running() const;

private:
  runtime::Runtime &runtime_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
};

} // namespace conductor::daemon
