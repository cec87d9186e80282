#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace conductor::common {

enum class ErrorCode {
  None,
  InvalidArgument,
  AlreadyExists,
  NotFound,
  InvalidTransition,
  Conflict,
  QueueTimeout,
  Cancelled,
  DeadlockDetected,
  PersistenceFailure,
  ConfigError,
  IoError,
};

[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::AlreadyExists:
    return "already_exists";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::InvalidTransition:
    return "invalid_transition";
  case ErrorCode::Conflict:
    return "conflict";
  case ErrorCode::QueueTimeout:
    return "queue_timeout";
  case ErrorCode::Cancelled:
    return "cancelled";
  case ErrorCode::DeadlockDetected:
    return "deadlock_detected";
  case ErrorCode::PersistenceFailure:
    return "persistence_failure";
  case ErrorCode::ConfigError:
    return "config_error";
  case ErrorCode::IoError:
    return "io_error";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(ErrorCode::None, ""); }
  static Status error(std::string message) {
    return Status(ErrorCode::InvalidArgument, std::move(message));
  }
  static Status error(ErrorCode code, std::string message) {
    return Status(code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorCode code, std::string error) : code_(code), error_(std::move(error)) {}

  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorCode::None, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(ErrorCode::InvalidArgument, std::nullopt, std::move(message));
  }
  static Result failure(ErrorCode code, std::string message) {
    return Result(code, std::nullopt, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(status.code(), std::nullopt, status.error());
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(code_, error_);
  }

private:
  Result(ErrorCode code, std::optional<T> value, std::string error)
      : code_(code), value_(std::move(value)), error_(std::move(error)) {}

  ErrorCode code_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace conductor::common
