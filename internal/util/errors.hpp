#pragma once

#include <stdexcept>
#include <string>

namespace slotkeeper::util {

/*
  Central error types.

  These get translated later to gRPC status codes.

  ValidationError and ConflictError are business rejections surfaced to the
  caller. MirrorSyncError never escapes the booking path. StoreUnavailable
  fails the whole request.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed date, time, duration or identifier. Raised before any lock is taken.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Requested slot is taken, either in the store or in the mirror.
class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MirrorSyncError : public std::runtime_error {
 public:
  explicit MirrorSyncError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace slotkeeper::util
