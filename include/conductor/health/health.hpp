#pragma once

#include "conductor/common/time.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace conductor::scheduler {
struct QueueStats;
}

namespace conductor::sessions {
struct SessionStats;
}

namespace conductor::health {

struct ComponentStatus {
  std::string status = "unknown";
  std::size_t restart_count = 0;
  std::optional<std::string> last_error;
  std::string updated_at;
  std::optional<std::string> last_ok;
};

struct HealthSnapshot {
  std::map<std::string, ComponentStatus> components;
};

/// Status of the runtime's background components, keyed by name.
class HealthRegistry {
public:
  explicit HealthRegistry(common::Clock clock = common::system_clock());

  void mark_starting(const std::string &name);
  void mark_ok(const std::string &name);
  void mark_error(const std::string &name, const std::string &error);
  void bump_restart(const std::string &name);
  void reset(const std::string &name);

  [[nodiscard]] std::optional<ComponentStatus> get(const std::string &name) const;
  [[nodiscard]] HealthSnapshot snapshot() const;
  /// True when no component is in error.
  [[nodiscard]] bool healthy() const;

private:
  common::Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, ComponentStatus> components_;
};

[[nodiscard]] std::string snapshot_json(const HealthSnapshot &snapshot);

/// Components plus session and queue statistics, as written to daemon_state.json.
[[nodiscard]] std::string render_report_json(const HealthSnapshot &snapshot,
                                             const sessions::SessionStats &sessions,
                                             const scheduler::QueueStats &queue);

} // namespace conductor::health
