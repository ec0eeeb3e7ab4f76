#pragma once

#include <stdexcept>
#include <string>

#include "internal/store/api/result.hpp"

namespace tkv::util {

/*
  Central error types.

  Store backends raise StoreError with a portable code; the core layer
  rethrows it with the failing step prepended to the message.
*/

class StoreError : public std::runtime_error {
 public:
  StoreError(store::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  explicit StoreError(const store::Result& result) : StoreError(result.code, result.message) {
  }

  store::ErrorCode code() const {
    return code_;
  }

  store::Result ToResult() const {
    return store::Result::Err(code_, what());
  }

 private:
  store::ErrorCode code_;
};

// The range procedure replied with something other than [total, values].
// Signals protocol or version drift rather than a transient failure.
class UnexpectedScriptResult : public StoreError {
 public:
  explicit UnexpectedScriptResult(const std::string& msg) : StoreError(store::ErrorCode::UnexpectedResult, msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tkv::util
