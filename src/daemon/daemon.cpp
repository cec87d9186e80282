#include "conductor/daemon/daemon.hpp"

#include "conductor/config/config.hpp"
#include "conductor/daemon/pid_file.hpp"
#include "conductor/daemon/state_writer.hpp"
#include "conductor/observability/global.hpp"

#include <csignal>
#include <iostream>
#include <thread>

namespace conductor::daemon {

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

extern "C" void handle_stop_signal(int signal) { g_signal_received = signal; }

class SignalGuard {
public:
  explicit SignalGuard(const bool enabled) : enabled_(enabled) {
    if (!enabled_) {
      return;
    }
    g_signal_received = 0;
    previous_int_ = std::signal(SIGINT, handle_stop_signal);
    previous_term_ = std::signal(SIGTERM, handle_stop_signal);
  }

  ~SignalGuard() {
    if (!enabled_) {
      return;
    }
    std::signal(SIGINT, previous_int_ == SIG_ERR ? SIG_DFL : previous_int_);
    std::signal(SIGTERM, previous_term_ == SIG_ERR ? SIG_DFL : previous_term_);
  }

  SignalGuard(const SignalGuard &) = delete;
  SignalGuard &operator=(const SignalGuard &) = delete;

private:
  bool enabled_;
  void (*previous_int_)(int) = SIG_DFL;
  void (*previous_term_)(int) = SIG_DFL;
};

} // namespace

Daemon::Daemon(runtime::Runtime &runtime) : runtime_(runtime) {}

Daemon::~Daemon() { request_stop(); }

common::Status Daemon::run(const DaemonOptions &options) {
  if (running_) {
    return common::Status::error(common::ErrorCode::AlreadyExists, "daemon already running");
  }

  std::filesystem::path state_dir = options.state_dir;
  if (state_dir.empty()) {
    auto cfg_dir = config::config_dir();
    if (!cfg_dir.ok()) {
      return cfg_dir.status();
    }
    state_dir = cfg_dir.value();
  }

  PidFile pid(state_dir / "daemon.pid");
  if (auto status = pid.acquire(); !status.ok()) {
    return status;
  }

  if (auto status = runtime_.start(); !status.ok()) {
    return status;
  }

  StateWriter state_writer(
      state_dir / "daemon_state.json", [this]() { return runtime_.health_report_json(); },
      options.state_interval);
  state_writer.start();

  SignalGuard signals(options.install_signal_handlers);
  stop_requested_ = false;
  running_ = true;
  std::cerr << "[daemon] running (pid file " << (state_dir / "daemon.pid").string() << ")\n";

  const auto started = std::chrono::steady_clock::now();
  while (!stop_requested_) {
    if (g_signal_received != 0) {
      std::cerr << "[daemon] received signal " << static_cast<int>(g_signal_received)
                << ", shutting down\n";
      break;
    }
    if (options.duration.has_value() &&
        std::chrono::steady_clock::now() - started >= *options.duration) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  const auto stopped = runtime_.stop();
  state_writer.stop();
  running_ = false;
  if (!stopped.ok()) {
    observability::record_error("daemon", "shutdown save failed: " + stopped.error());
    return stopped;
  }
  std::cerr << "[daemon] stopped\n";
  return common::Status::success();
}

void Daemon::request_stop() { stop_requested_ = true; }

bool Daemon::is_running() const { return running_; }

} // namespace conductor::daemon
