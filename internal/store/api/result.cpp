#include "result.hpp"

namespace tkv::store {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NOT_FOUND";
    case ErrorCode::InvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorCode::Busy:
      return "BUSY";
    case ErrorCode::WrongType:
      return "WRONGTYPE";
    case ErrorCode::NoScript:
      return "NOSCRIPT";
    case ErrorCode::UnexpectedResult:
      return "UNEXPECTED_RESULT";
    case ErrorCode::Cancelled:
      return "CANCELLED";
    case ErrorCode::DeadlineExceeded:
      return "DEADLINE_EXCEEDED";
    case ErrorCode::IOError:
      return "IO_ERROR";
    case ErrorCode::Corruption:
      return "CORRUPTION";
    case ErrorCode::InternalError:
      return "INTERNAL";
  }
  return "UNKNOWN";
}

} // namespace tkv::store
