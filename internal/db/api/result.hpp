#pragma once

#include <string>
#include <string_view>

namespace issueflow::db {

/*
  Portable store result codes.

  Every backend translates its own errors into these; nothing above
  internal/db sees sqlite or pqxx types. How the service layer surfaces them
  (see core::ThrowIfDbError):

    AlreadyExists         duplicate issue id or edge
    NotFound              missing issue, or an edge endpoint that vanished
    Conflict              a compare-and-set lost against another writer
    SerializationFailure  postgres gave up on the transaction; same as Conflict
    Busy                  write lock not acquired within the busy timeout
    Timeout               statement outcome unknown
    Unavailable           store cannot be reached or opened
    ConstraintViolation   a row the schema rejects
    IOError, Corruption,
    Unsupported,
    InternalError         system errors
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  Busy,
  Timeout,
  Unavailable,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

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

// Retrying the same command later may succeed: reported as transient_failure.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::Timeout || code == ErrorCode::Unavailable;
}

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace issueflow::db
