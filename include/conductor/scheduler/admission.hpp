#pragma once

#include "conductor/common/result.hpp"

#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <string_view>

namespace conductor::scheduler {

struct AdmissionOutcome {
  enum class Kind { Granted, QueueTimeout, Cancelled };

  Kind kind = Kind::Granted;
  std::string reason;
  std::chrono::milliseconds waited{0};

  [[nodiscard]] bool granted() const { return kind == Kind::Granted; }
  /// Granted maps to success; the others to ErrorCode::QueueTimeout / Cancelled.
  [[nodiscard]] common::Status status() const;
};

[[nodiscard]] std::string_view admission_kind_name(AdmissionOutcome::Kind kind);

/// Handle returned by Scheduler::request_execution. Resolved exactly once.
class AdmissionTicket {
public:
  AdmissionTicket(std::string session_id, std::shared_future<AdmissionOutcome> outcome);

  [[nodiscard]] const std::string &session_id() const { return session_id_; }
  [[nodiscard]] bool ready() const;
  [[nodiscard]] AdmissionOutcome wait() const;
  [[nodiscard]] std::optional<AdmissionOutcome> wait_for(std::chrono::milliseconds timeout) const;

private:
  std::string session_id_;
  std::shared_future<AdmissionOutcome> outcome_;
};

} // namespace conductor::scheduler
