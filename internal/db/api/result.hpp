#pragma once

#include <string>
#include <string_view>

namespace graphdoc::db {

/*
  Outcome of a repository write.

  Backends translate driver errors into these codes; nothing above the
  repository sees a pqxx or sqlite3 error type.

  AlreadyExists: a uniqueness constraint rejected the row
  ConstraintViolation: a referenced row is missing
  Busy / Conflict / SerializationFailure / IOError: the store could not
    complete the statement; the caller may retry the whole transaction
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  ConstraintViolation,

  Busy,
  Conflict,
  SerializationFailure,
  IOError,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
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

} // namespace graphdoc::db
