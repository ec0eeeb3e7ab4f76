#pragma once

#include <shared_mutex>
#include <string>

#include "internal/store/api/store.hpp"

namespace tkv::core {

/*
  Lazily registered script handle for one store.

  Readers take the shared lock only; the first caller registers under
  the exclusive lock and every concurrent caller ends up with the same
  handle. A failed registration leaves the cache empty, so the next
  call simply tries again.
*/
class ScriptHandle {
 public:
  ScriptHandle(store::Store& store, store::Script script);

  // Cached handle, registering on first use. Throws StoreError.
  std::string Get(const util::Context& ctx);

  // Store reported NOSCRIPT for `stale`: register again. When another
  // caller already replaced it, their handle is returned.
  std::string Reload(const util::Context& ctx, const std::string& stale);

  void Invalidate();

 private:
  std::string LoadLocked(const util::Context& ctx);

  store::Store&             store_;
  store::Script             script_;
  mutable std::shared_mutex mutex_;
  std::string               sha_;
};

} // namespace tkv::core
