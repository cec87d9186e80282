#pragma once

#include "conductor/common/time.hpp"
#include "conductor/sessions/store.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace conductor::sessions {

struct RecoveryOptions {
  std::chrono::minutes initializing_timeout{10};
  std::chrono::minutes starting_timeout{15};
  std::chrono::minutes running_warning{60};
};

struct RecoveryReport {
  std::size_t examined = 0;
  /// Thread ids moved to Error.
  std::vector<std::string> recovered;
  /// Thread ids running longer than the warning threshold.
  std::vector<std::string> long_running;
  /// Thread ids that changed or disappeared between the snapshot and the update.
  std::vector<std::string> skipped;
  std::vector<std::string> failures;
};

/// Moves sessions stuck in Initializing or Starting to Error.
class AutoRecovery {
public:
  AutoRecovery(SessionStore &store, RecoveryOptions options,
               common::Clock clock = common::system_clock());

  RecoveryReport sweep();

private:
  SessionStore &store_;
  RecoveryOptions options_;
  common::Clock clock_;
};

} // namespace conductor::sessions
