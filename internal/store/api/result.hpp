#pragma once

#include <string>

namespace tkv::store {

/*
  Portable store result codes.

  Every backend translates its native errors into these.
  The core layer never sees sqlite/pqxx error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  InvalidArgument,
  Busy,
  WrongType,
  NoScript,
  UnexpectedResult,

  Cancelled,
  DeadlineExceeded,

  IOError,
  Corruption,

  InternalError
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // Same code, message prefixed with the failing step.
  Result Wrap(const std::string& context) const {
    if (code == ErrorCode::OK) return *this;
    return {code, message.empty() ? context : context + ": " + message};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace tkv::store
