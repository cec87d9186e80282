#pragma once

#include "conductor/observability/observer.hpp"

#include <memory>

namespace conductor::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void log(LogLevel level, const std::string &component, const std::string &message);
void log_debug(const std::string &component, const std::string &message);
void log_info(const std::string &component, const std::string &message);
void log_warn(const std::string &component, const std::string &message);

void record_admission(const std::string &session_id, const std::string &outcome,
                      std::chrono::milliseconds waited);
void record_transition(const std::string &session_id, const std::string &from,
                       const std::string &to);
void record_sweep(const std::string &sweep, std::size_t examined, std::size_t affected);
void record_persistence(const std::string &path, bool success, const std::string &detail = "");
void record_error(const std::string &component, const std::string &message);

} // namespace conductor::observability
