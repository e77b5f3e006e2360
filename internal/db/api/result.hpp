#pragma once

#include <string>

namespace sessionkeeper::db {

/*
  Portable DB result codes.

  The store layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  // Compare-and-set precondition no longer holds (lost race).
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,
  Unavailable,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Busy/locked databases, I/O failures and dropped connections are worth retrying.
inline bool IsRetryable(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::IOError || code == ErrorCode::Unavailable ||
         code == ErrorCode::SerializationFailure;
}

} // namespace sessionkeeper::db
