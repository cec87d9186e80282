#include "conductor/daemon/pid_file.hpp"

#include "conductor/common/fs.hpp"

#include <cstdlib>

#include <signal.h>
#include <unistd.h>

namespace conductor::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  if (!path_.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path_.parent_path()); !dir.ok()) {
      return dir.status();
    }
  }

  const auto existing = common::read_file(path_);
  if (existing.ok()) {
    const int existing_pid = std::atoi(common::trim(existing.value()).c_str());
    if (existing_pid > 0 && is_process_running(existing_pid)) {
      return common::Status::error(common::ErrorCode::AlreadyExists,
                                   "daemon already running with pid " +
                                       std::to_string(existing_pid));
    }
  } else if (existing.code() != common::ErrorCode::NotFound) {
    return existing.status();
  }

  const int pid = static_cast<int>(getpid());
  if (auto status = common::write_file_atomic(path_, std::to_string(pid) + "\n"); !status.ok()) {
    return status;
  }
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(pid, 0) == 0;
}

} // namespace conductor::daemon
