#include "conductor/health/health.hpp"

#include "conductor/common/json_util.hpp"
#include "conductor/scheduler/scheduler_events.hpp"
#include "conductor/sessions/store.hpp"

#include <iomanip>
#include <sstream>

namespace conductor::health {

namespace {

std::string fixed(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

} // namespace

HealthRegistry::HealthRegistry(common::Clock clock) : clock_(std::move(clock)) {}

void HealthRegistry::mark_starting(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &component = components_[name];
  component.status = "starting";
  component.updated_at = common::format_timestamp(clock_());
  component.last_error.reset();
}

void HealthRegistry::mark_ok(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &component = components_[name];
  component.status = "ok";
  component.updated_at = common::format_timestamp(clock_());
  component.last_ok = component.updated_at;
  component.last_error.reset();
}

void HealthRegistry::mark_error(const std::string &name, const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &component = components_[name];
  component.status = "error";
  component.updated_at = common::format_timestamp(clock_());
  component.last_error = error;
}

void HealthRegistry::bump_restart(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &component = components_[name];
  ++component.restart_count;
  component.updated_at = common::format_timestamp(clock_());
}

void HealthRegistry::reset(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  components_.erase(name);
}

std::optional<ComponentStatus> HealthRegistry::get(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = components_.find(name);
  if (it == components_.end()) {
    return std::nullopt;
  }
  return it->second;
}

HealthSnapshot HealthRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return HealthSnapshot{.components = components_};
}

bool HealthRegistry::healthy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[name, component] : components_) {
    if (component.status == "error") {
      return false;
    }
  }
  return true;
}

std::string snapshot_json(const HealthSnapshot &snapshot) {
  std::ostringstream json;
  json << "{";
  bool first = true;
  for (const auto &[name, status] : snapshot.components) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << common::json_quote(name) << ":{";
    json << "\"status\":" << common::json_quote(status.status) << ",";
    json << "\"restart_count\":" << status.restart_count;
    if (!status.updated_at.empty()) {
      json << ",\"updated_at\":" << common::json_quote(status.updated_at);
    }
    if (status.last_ok.has_value()) {
      json << ",\"last_ok\":" << common::json_quote(*status.last_ok);
    }
    if (status.last_error.has_value()) {
      json << ",\"last_error\":" << common::json_quote(*status.last_error);
    }
    json << "}";
  }
  json << "}";
  return json.str();
}

std::string render_report_json(const HealthSnapshot &snapshot,
                               const sessions::SessionStats &sessions,
                               const scheduler::QueueStats &queue) {
  std::ostringstream json;
  json << "{";
  json << "\"components\":" << snapshot_json(snapshot) << ",";

  json << "\"sessions\":{";
  json << "\"total\":" << sessions.total << ",";
  json << "\"active\":" << sessions.active << ",";
  json << "\"error_rate\":" << fixed(sessions.error_rate) << ",";
  json << "\"by_state\":{";
  bool first = true;
  for (const auto &[state, count] : sessions.by_state) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << common::json_quote(std::string(sessions::to_string(state))) << ":" << count;
  }
  json << "}";
  if (sessions.average_duration_minutes.has_value()) {
    json << ",\"average_duration_minutes\":" << fixed(*sessions.average_duration_minutes);
  }
  json << "},";

  json << "\"queue\":{";
  json << "\"running\":" << queue.running << ",";
  json << "\"waiting\":" << queue.waiting << ",";
  json << "\"max_sessions\":" << queue.max_sessions << ",";
  json << "\"average_wait_seconds\":" << fixed(queue.average_wait_seconds) << ",";
  json << "\"max_wait_seconds\":" << fixed(queue.max_wait_seconds);
  json << "}";

  json << "}";
  return json.str();
}

} // namespace conductor::health
