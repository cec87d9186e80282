#pragma once

#include "conductor/common/time.hpp"
#include "conductor/scheduler/admission.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor::scheduler {

struct QueueEntry {
  std::string session_id;
  std::int32_t priority = 10;
  common::TimePoint queued_at{};
  std::optional<common::TimePoint> deadline;
  std::shared_ptr<std::promise<AdmissionOutcome>> promise;
};

/// Priority-ordered wait list. Lower priority values sort first; equal priorities keep
/// arrival order. Not thread-safe; the scheduler guards it.
class WaitList {
public:
  /// Inserts before the first entry with a strictly greater priority value.
  void insert(QueueEntry entry);
  [[nodiscard]] std::optional<QueueEntry> remove(const std::string &session_id);
  [[nodiscard]] QueueEntry take_at(std::size_t index);

  /// 1-indexed rank, or -1 when absent.
  [[nodiscard]] int position(const std::string &session_id) const;
  [[nodiscard]] bool contains(const std::string &session_id) const;
  [[nodiscard]] const QueueEntry *find(const std::string &session_id) const;
  [[nodiscard]] const std::vector<QueueEntry> &entries() const { return entries_; }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }

  /// Ids whose deadline is at or before `now`, in list order.
  [[nodiscard]] std::vector<std::string> expired(common::TimePoint now) const;
  [[nodiscard]] std::vector<QueueEntry> drain();

private:
  std::vector<QueueEntry> entries_;
};

} // namespace conductor::scheduler
