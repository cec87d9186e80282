#pragma once

#include "conductor/common/result.hpp"
#include "conductor/scheduler/context.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conductor::scheduler {

class Scheduler;

struct DroppedEdge {
  std::string session_id;
  std::string dependency;
};

struct DeadlockReport {
  std::size_t examined = 0;
  std::size_t deadlocks = 0;
  std::vector<DroppedEdge> dropped;
};

/// Picks which direct dependency of a deadlocked session to drop.
class DeadlockResolutionPolicy {
public:
  virtual ~DeadlockResolutionPolicy() = default;

  /// Returns nullopt when the session has no dependency to drop.
  [[nodiscard]] virtual std::optional<std::string>
  choose(const SchedulerContext &session, const ContextMap &contexts) const = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Drops the dependency that was enqueued first.
class OldestDependencyPolicy final : public DeadlockResolutionPolicy {
public:
  [[nodiscard]] std::optional<std::string> choose(const SchedulerContext &session,
                                                  const ContextMap &contexts) const override;
  [[nodiscard]] std::string_view name() const override { return "oldest"; }
};

/// Drops the dependency with the largest priority value.
class LowestPriorityDependencyPolicy final : public DeadlockResolutionPolicy {
public:
  [[nodiscard]] std::optional<std::string> choose(const SchedulerContext &session,
                                                  const ContextMap &contexts) const override;
  [[nodiscard]] std::string_view name() const override { return "lowest_priority"; }
};

[[nodiscard]] common::Result<std::unique_ptr<DeadlockResolutionPolicy>>
make_deadlock_policy(const std::string &name);

/// Depth-first walk from `start` along edges to Waiting contexts. Returns the path up to
/// and including the first node revisited on it, or nullopt when no cycle is reachable.
[[nodiscard]] std::optional<std::vector<std::string>>
find_dependency_cycle(const std::string &start, const ContextMap &contexts);

/// Periodic sweep over the scheduler's waiting sessions.
class DeadlockDetector {
public:
  DeadlockDetector(Scheduler &scheduler, std::unique_ptr<DeadlockResolutionPolicy> policy);

  DeadlockReport sweep();
  [[nodiscard]] const DeadlockResolutionPolicy &policy() const { return *policy_; }

private:
  Scheduler &scheduler_;
  std::unique_ptr<DeadlockResolutionPolicy> policy_;
};

} // namespace conductor::scheduler
