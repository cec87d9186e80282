#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace conductor::daemon {

/// Periodically writes {"written_at","uptime_seconds","report"} to a state file.
class StateWriter {
public:
  using ReportFn = std::function<std::string()>;

  StateWriter(std::filesystem::path state_file, ReportFn report,
              std::chrono::milliseconds interval = std::chrono::seconds(5));
  ~StateWriter();

  void start();
  /// Writes a final state before returning.
  void stop();
  [[nodiscard]] bool is_running() const;

  void write_state() const;

private:
  void write_loop();

  std::filesystem::path state_file_;
  ReportFn report_;
  std::chrono::milliseconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::chrono::steady_clock::time_point started_at_{};
};

} // namespace conductor::daemon
