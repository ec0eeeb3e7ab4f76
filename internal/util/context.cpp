#include "context.hpp"

#include "internal/util/errors.hpp"

namespace tkv::util {

Context::Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
}

Context Context::Background() {
  return Context();
}

Context Context::WithTimeout(DeadlineClock::duration timeout) {
  return WithDeadline(DeadlineClock::now() + timeout);
}

Context Context::WithDeadline(DeadlineClock::time_point deadline) {
  Context ctx;
  ctx.deadline_ = deadline;
  return ctx;
}

void Context::Cancel() const {
  cancelled_->store(true, std::memory_order_release);
}

bool Context::IsCancelled() const {
  return cancelled_->load(std::memory_order_acquire);
}

store::Result Context::Err() const {
  if (IsCancelled()) {
    return store::Result::Err(store::ErrorCode::Cancelled, "context cancelled");
  }
  if (deadline_ && DeadlineClock::now() >= *deadline_) {
    return store::Result::Err(store::ErrorCode::DeadlineExceeded, "context deadline exceeded");
  }
  return store::Result::Ok();
}

void Context::ThrowIfDone() const {
  if (auto err = Err(); !err) {
    throw StoreError(err);
  }
}

} // namespace tkv::util
