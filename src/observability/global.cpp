#include "conductor/observability/global.hpp"

#include <mutex>

namespace conductor::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void log(const LogLevel level, const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = level, .component = component, .message = message});
}

void log_debug(const std::string &component, const std::string &message) {
  log(LogLevel::Debug, component, message);
}

void log_info(const std::string &component, const std::string &message) {
  log(LogLevel::Info, component, message);
}

void log_warn(const std::string &component, const std::string &message) {
  log(LogLevel::Warn, component, message);
}

void record_admission(const std::string &session_id, const std::string &outcome,
                      const std::chrono::milliseconds waited) {
  record_event(AdmissionEvent{.session_id = session_id, .outcome = outcome, .waited = waited});
  record_metric(QueueWaitMetric{.wait = waited});
}

void record_transition(const std::string &session_id, const std::string &from,
                       const std::string &to) {
  record_event(SessionTransitionEvent{.session_id = session_id, .from = from, .to = to});
}

void record_sweep(const std::string &sweep, const std::size_t examined,
                  const std::size_t affected) {
  record_event(SweepEvent{.sweep = sweep, .examined = examined, .affected = affected});
}

void record_persistence(const std::string &path, const bool success, const std::string &detail) {
  record_event(PersistenceEvent{.path = path, .success = success, .detail = detail});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace conductor::observability
