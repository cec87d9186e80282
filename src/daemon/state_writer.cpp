#include "conductor/daemon/state_writer.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/json_util.hpp"
#include "conductor/common/time.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace conductor::daemon {

StateWriter::StateWriter(std::filesystem::path state_file, ReportFn report,
                         const std::chrono::milliseconds interval)
    : state_file_(std::move(state_file)), report_(std::move(report)), interval_(interval) {}

StateWriter::~StateWriter() { stop(); }

void StateWriter::start() {
  if (running_) {
    return;
  }
  running_ = true;
  started_at_ = std::chrono::steady_clock::now();
  thread_ = std::thread([this]() { write_loop(); });
}

void StateWriter::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool StateWriter::is_running() const { return running_; }

void StateWriter::write_loop() {
  const auto slices = std::max<std::int64_t>(1, interval_.count() / 100);
  while (running_) {
    write_state();
    for (std::int64_t i = 0; i < slices && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
  write_state();
}

void StateWriter::write_state() const {
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_at_)
                          .count();

  std::ostringstream json;
  json << "{";
  json << "\"written_at\":" << common::json_quote(common::format_timestamp(common::now()))
       << ",";
  json << "\"uptime_seconds\":" << uptime << ",";
  json << "\"report\":" << report_();
  json << "}\n";

  if (!state_file_.parent_path().empty()) {
    if (auto dir = common::ensure_dir(state_file_.parent_path()); !dir.ok()) {
      std::cerr << "[daemon][state] " << dir.error() << "\n";
      return;
    }
  }
  if (auto status = common::write_file_atomic(state_file_, json.str()); !status.ok()) {
    std::cerr << "[daemon][state] write failed: " << status.error() << "\n";
  }
}

} // namespace conductor::daemon
