#include "conductor/runtime/periodic.hpp"

#include "conductor/observability/global.hpp"

#include <algorithm>
#include <exception>

namespace conductor::runtime {

PeriodicTask::PeriodicTask(std::string name, const std::chrono::milliseconds interval, Fn fn,
                           health::HealthRegistry *health)
    : name_(std::move(name)), interval_(std::max(interval, std::chrono::milliseconds(1))),
      fn_(std::move(fn)), health_(health) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  if (running_) {
    return;
  }
  running_ = true;
  if (health_ != nullptr) {
    health_->mark_starting(name_);
  }
  thread_ = std::thread([this]() { loop(); });
}

void PeriodicTask::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool PeriodicTask::is_running() const { return running_; }

common::Status PeriodicTask::run_once() {
  common::Status status = common::Status::success();
  try {
    status = fn_();
  } catch (const std::exception &ex) {
    status = common::Status::error(common::ErrorCode::IoError,
                                   std::string("task threw: ") + ex.what());
  }
  ++runs_;

  if (status.ok()) {
    if (health_ != nullptr) {
      health_->mark_ok(name_);
    }
  } else {
    observability::record_error(name_, status.error());
    if (health_ != nullptr) {
      health_->mark_error(name_, status.error());
    }
  }
  return status;
}

void PeriodicTask::loop() {
  const auto slice = std::min(interval_, std::chrono::milliseconds(100));
  auto next = std::chrono::steady_clock::now() + interval_;
  while (running_) {
    if (std::chrono::steady_clock::now() >= next) {
      (void)run_once();
      next = std::chrono::steady_clock::now() + interval_;
      continue;
    }
    std::this_thread::sleep_for(slice);
  }
}

} // namespace conductor::runtime
