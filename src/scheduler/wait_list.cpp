#include "conductor/scheduler/wait_list.hpp"

#include <algorithm>

namespace conductor::scheduler {

void WaitList::insert(QueueEntry entry) {
  const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const QueueEntry &e) {
    return e.priority > entry.priority;
  });
  entries_.insert(it, std::move(entry));
}

std::optional<QueueEntry> WaitList::remove(const std::string &session_id) {
  const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const QueueEntry &e) {
    return e.session_id == session_id;
  });
  if (it == entries_.end()) {
    return std::nullopt;
  }
  QueueEntry entry = std::move(*it);
  entries_.erase(it);
  return entry;
}

QueueEntry WaitList::take_at(const std::size_t index) {
  QueueEntry entry = std::move(entries_.at(index));
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
  return entry;
}

int WaitList::position(const std::string &session_id) const {
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].session_id == session_id) {
      return static_cast<int>(i) + 1;
    }
  }
  return -1;
}

bool WaitList::contains(const std::string &session_id) const { return find(session_id) != nullptr; }

const QueueEntry *WaitList::find(const std::string &session_id) const {
  for (const auto &entry : entries_) {
    if (entry.session_id == session_id) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<std::string> WaitList::expired(const common::TimePoint now) const {
  std::vector<std::string> ids;
  for (const auto &entry : entries_) {
    if (entry.deadline.has_value() && *entry.deadline <= now) {
      ids.push_back(entry.session_id);
    }
  }
  return ids;
}

std::vector<QueueEntry> WaitList::drain() {
  std::vector<QueueEntry> out;
  out.swap(entries_);
  return out;
}

} // namespace conductor::scheduler
