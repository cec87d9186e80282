#pragma once

#include "conductor/observability/global.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace conductor::events {

using SubscriptionId = std::uint64_t;

/// Synchronous typed publish/subscribe. `Event` must expose a `type` member of
/// `Event::Type`. Handlers for a type run in registration order on the emitting thread.
template <typename Event> class EventBus {
public:
  using Type = typename Event::Type;
  using Handler = std::function<void(const Event &)>;

  SubscriptionId on(const Type type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = next_id_++;
    handlers_[type].emplace_back(id, std::move(handler));
    return id;
  }

  /// Returns false when no such subscription exists.
  bool off(const Type type, const SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(type);
    if (it == handlers_.end()) {
      return false;
    }
    auto &list = it->second;
    for (auto entry = list.begin(); entry != list.end(); ++entry) {
      if (entry->first == id) {
        list.erase(entry);
        return true;
      }
    }
    return false;
  }

  void emit(const Event &event) const {
    std::vector<Handler> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto it = handlers_.find(event.type);
      if (it == handlers_.end()) {
        return;
      }
      snapshot.reserve(it->second.size());
      for (const auto &[id, handler] : it->second) {
        snapshot.push_back(handler);
      }
    }

    for (const auto &handler : snapshot) {
      try {
        handler(event);
      } catch (const std::exception &ex) {
        observability::record_error("events", std::string("handler failed: ") + ex.what());
      } catch (...) {
        observability::record_error("events", "handler failed with a non-standard exception");
      }
    }
  }

  [[nodiscard]] std::size_t handler_count(const Type type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = handlers_.find(type);
    return it == handlers_.end() ? 0 : it->second.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
  }

private:
  mutable std::mutex mutex_;
  std::map<Type, std::vector<std::pair<SubscriptionId, Handler>>> handlers_;
  SubscriptionId next_id_ = 1;
};

} // namespace conductor::events
