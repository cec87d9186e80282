#pragma once

#include "conductor/common/result.hpp"

#include <filesystem>

namespace conductor::daemon {

/// Single-instance guard: refuses to start while another live process holds the file.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace conductor::daemon
