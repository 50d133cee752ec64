#pragma once

#include <string>

namespace datagraph::db {

// Outcome of a single repository write. Backends map their native errors
// onto these codes; core::ThrowIfDbError turns them into util exceptions.
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  // lock or serialization contention, surfaced as util::Conflict
  Busy,
  SerializationFailure,
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

} // namespace datagraph::db
