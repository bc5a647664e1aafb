#pragma once

#include <string>

namespace slotkeeper::db {

/*
  Outcome of one repository call.

  Backends map their native failures (sqlite3 result codes, pqxx exceptions)
  onto ErrorCode; nothing above internal/db sees a backend error type.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  // primary key or unique index already holds the row
  AlreadyExists,
  ConstraintViolation,
  // the row changed under a lock scope the caller did not hold
  Conflict,

  // lock wait timed out, serialization failure, lost connection
  Busy,
  SerializationFailure,
  IOError,
  Corruption,

  InternalError
};

// The store could not run the call at all; callers retry later.
inline bool IsStoreUnavailable(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure || code == ErrorCode::IOError ||
         code == ErrorCode::Corruption;
}

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

} // namespace slotkeeper::db
