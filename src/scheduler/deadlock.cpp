#include "conductor/scheduler/deadlock.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/observability/global.hpp"
#include "conductor/scheduler/scheduler.hpp"

#include <algorithm>
#include <functional>
#include <set>

namespace conductor::scheduler {

std::optional<std::string> OldestDependencyPolicy::choose(const SchedulerContext &session,
                                                          const ContextMap &contexts) const {
  if (session.dependencies.empty()) {
    return std::nullopt;
  }
  std::optional<std::string> oldest;
  common::TimePoint oldest_at{};
  for (const auto &dependency : session.dependencies) {
    const auto it = contexts.find(dependency);
    if (it == contexts.end()) {
      continue;
    }
    if (!oldest.has_value() || it->second.queued_at < oldest_at) {
      oldest = dependency;
      oldest_at = it->second.queued_at;
    }
  }
  return oldest.has_value() ? oldest : session.dependencies.front();
}

std::optional<std::string>
LowestPriorityDependencyPolicy::choose(const SchedulerContext &session,
                                       const ContextMap &contexts) const {
  if (session.dependencies.empty()) {
    return std::nullopt;
  }
  std::optional<std::string> lowest;
  std::int32_t lowest_priority = 0;
  for (const auto &dependency : session.dependencies) {
    const auto it = contexts.find(dependency);
    if (it == contexts.end()) {
      continue;
    }
    if (!lowest.has_value() || it->second.priority > lowest_priority) {
      lowest = dependency;
      lowest_priority = it->second.priority;
    }
  }
  return lowest.has_value() ? lowest : session.dependencies.front();
}

common::Result<std::unique_ptr<DeadlockResolutionPolicy>>
make_deadlock_policy(const std::string &name) {
  using R = common::Result<std::unique_ptr<DeadlockResolutionPolicy>>;
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized.empty() || normalized == "oldest") {
    return R::success(std::make_unique<OldestDependencyPolicy>());
  }
  if (normalized == "lowest_priority") {
    return R::success(std::make_unique<LowestPriorityDependencyPolicy>());
  }
  return R::failure(common::ErrorCode::ConfigError, "Unknown deadlock policy: " + name);
}

std::optional<std::vector<std::string>> find_dependency_cycle(const std::string &start,
                                                              const ContextMap &contexts) {
  std::vector<std::string> path;
  std::set<std::string> on_path;
  std::set<std::string> finished;

  std::function<bool(const std::string &)> visit = [&](const std::string &id) -> bool {
    if (on_path.contains(id)) {
      path.push_back(id);
      return true;
    }
    if (finished.contains(id)) {
      return false;
    }
    const auto it = contexts.find(id);
    if (it == contexts.end()) {
      return false;
    }

    path.push_back(id);
    on_path.insert(id);
    for (const auto &dependency : it->second.dependencies) {
      const auto dep = contexts.find(dependency);
      if (dep == contexts.end() || dep->second.state != ContextState::Waiting) {
        continue;
      }
      if (visit(dependency)) {
        return true;
      }
    }
    on_path.erase(id);
    path.pop_back();
    finished.insert(id);
    return false;
  };

  if (visit(start)) {
    return path;
  }
  return std::nullopt;
}

DeadlockDetector::DeadlockDetector(Scheduler &scheduler,
                                   std::unique_ptr<DeadlockResolutionPolicy> policy)
    : scheduler_(scheduler), policy_(std::move(policy)) {
  if (!policy_) {
    policy_ = std::make_unique<OldestDependencyPolicy>();
  }
}

DeadlockReport DeadlockDetector::sweep() {
  auto report = scheduler_.resolve_deadlocks(*policy_);
  if (report.deadlocks > 0) {
    observability::log_warn("deadlock", "found " + std::to_string(report.deadlocks) +
                                            " deadlocked session(s), dropped " +
                                            std::to_string(report.dropped.size()) +
                                            " dependency edge(s)");
  }
  return report;
}

} // namespace conductor::scheduler
