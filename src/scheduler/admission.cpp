#include "conductor/scheduler/admission.hpp"

namespace conductor::scheduler {

std::string_view admission_kind_name(const AdmissionOutcome::Kind kind) {
  switch (kind) {
  case AdmissionOutcome::Kind::Granted:
    return "granted";
  case AdmissionOutcome::Kind::QueueTimeout:
    return "queue_timeout";
  case AdmissionOutcome::Kind::Cancelled:
    return "cancelled";
  }
  return "cancelled";
}

common::Status AdmissionOutcome::status() const {
  switch (kind) {
  case Kind::Granted:
    return common::Status::success();
  case Kind::QueueTimeout:
    return common::Status::error(common::ErrorCode::QueueTimeout, reason);
  case Kind::Cancelled:
    return common::Status::error(common::ErrorCode::Cancelled, reason);
  }
  return common::Status::error(common::ErrorCode::Cancelled, reason);
}

AdmissionTicket::AdmissionTicket(std::string session_id,
                                 std::shared_future<AdmissionOutcome> outcome)
    : session_id_(std::move(session_id)), outcome_(std::move(outcome)) {}

bool AdmissionTicket::ready() const {
  return outcome_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

AdmissionOutcome AdmissionTicket::wait() const { return outcome_.get(); }

std::optional<AdmissionOutcome>
AdmissionTicket::wait_for(const std::chrono::milliseconds timeout) const {
  if (outcome_.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  return outcome_.get();
}

} // namespace conductor::scheduler
