#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "internal/store/api/result.hpp"

namespace tkv::util {

/*
  Per-call invocation context.

  Carries a cancellation flag and an optional deadline. Copies share the
  flag, so cancelling any copy cancels every call that was handed one.
  Stores check it before each command they issue.
*/
class Context {
 public:
  using DeadlineClock = std::chrono::steady_clock;

  Context();

  static Context Background();
  static Context WithTimeout(DeadlineClock::duration timeout);
  static Context WithDeadline(DeadlineClock::time_point deadline);

  void Cancel() const;

  bool                                    IsCancelled() const;
  std::optional<DeadlineClock::time_point> Deadline() const {
    return deadline_;
  }

  // OK while the call may proceed, Cancelled or DeadlineExceeded otherwise.
  store::Result Err() const;

  // Throws StoreError when Err() is not OK.
  void ThrowIfDone() const;

 private:
  std::shared_ptr<std::atomic<bool>>       cancelled_;
  std::optional<DeadlineClock::time_point> deadline_;
};

} // namespace tkv::util
