/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace tfleet {

/**
 * @brief Error taxonomy shared by the coordinator components, the wire protocol and the
 * worker-local checkpoint store. The numeric values travel on the wire, append only.
 */
enum class ErrorCode {
  OK = 0,
  NOT_FOUND = 1,
  UNKNOWN_WORKER = 2,
  DUPLICATE_WORKER = 3,
  SPEC_MISMATCH = 4,
  ALREADY_COMPLETE = 5,
  TIMEOUT = 6,
  BARRIER_TIMEOUT = 7,
  CANCELLED = 8,
  INVALID_ARGUMENT = 9,
  IO_FAILURE = 10,
  RESOURCE_EXHAUSTED = 11,
  TRANSPORT = 12,
  INTERNAL = 13,
};

inline const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::OK:
    return "OK";
  case ErrorCode::NOT_FOUND:
    return "NOT_FOUND";
  case ErrorCode::UNKNOWN_WORKER:
    return "UNKNOWN_WORKER";
  case ErrorCode::DUPLICATE_WORKER:
    return "DUPLICATE_WORKER";
  case ErrorCode::SPEC_MISMATCH:
    return "SPEC_MISMATCH";
  case ErrorCode::ALREADY_COMPLETE:
    return "ALREADY_COMPLETE";
  case ErrorCode::TIMEOUT:
    return "TIMEOUT";
  case ErrorCode::BARRIER_TIMEOUT:
    return "BARRIER_TIMEOUT";
  case ErrorCode::CANCELLED:
    return "CANCELLED";
  case ErrorCode::INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case ErrorCode::IO_FAILURE:
    return "IO_FAILURE";
  case ErrorCode::RESOURCE_EXHAUSTED:
    return "RESOURCE_EXHAUSTED";
  case ErrorCode::TRANSPORT:
    return "TRANSPORT";
  case ErrorCode::INTERNAL:
    return "INTERNAL";
  }
  return "UNKNOWN";
}

class FleetError : public std::runtime_error {
public:
  FleetError(ErrorCode code, const std::string &message)
      : std::runtime_error(std::string(error_code_name(code)) + ": " + message), code_(code),
        detail_(message) {}

  ErrorCode code() const noexcept { return code_; }

  // message without the code prefix, used when the error is put back on the wire
  const std::string &detail() const noexcept { return detail_; }

  /**
   * @brief Registration cannot be retried around: the worker has no rank without it.
   */
  bool is_fatal_for_worker() const noexcept {
    return code_ == ErrorCode::DUPLICATE_WORKER || code_ == ErrorCode::RESOURCE_EXHAUSTED ||
           code_ == ErrorCode::INVALID_ARGUMENT;
  }

  bool is_retryable() const noexcept {
    return code_ == ErrorCode::TIMEOUT || code_ == ErrorCode::BARRIER_TIMEOUT ||
           code_ == ErrorCode::TRANSPORT || code_ == ErrorCode::IO_FAILURE;
  }

private:
  ErrorCode code_;
  std::string detail_;
};

namespace errors {

inline FleetError not_found(const std::string &what) {
  return FleetError(ErrorCode::NOT_FOUND, what + " not found");
}

inline FleetError unknown_worker(const std::string &worker_id) {
  return FleetError(ErrorCode::UNKNOWN_WORKER, "Worker not registered: " + worker_id);
}

inline FleetError invalid_argument(const std::string &message) {
  return FleetError(ErrorCode::INVALID_ARGUMENT, message);
}

inline FleetError io_failure(const std::string &message) {
  return FleetError(ErrorCode::IO_FAILURE, message);
}

} // namespace errors

} // namespace tfleet
