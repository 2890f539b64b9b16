#pragma once

#include <string>

namespace sitestore::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  AlreadyExists,
  Busy,
  Unavailable,

  ConstraintViolation,

  IOError,
  Corruption,

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

// Busy, Unavailable and IOError are transport-level; everything else is a rejected statement.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::Unavailable || code == ErrorCode::IOError;
}

} // namespace sitestore::db
