#include "internal/core/script_handle.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"

namespace tkv::core {

ScriptHandle::ScriptHandle(store::Store& store, store::Script script) : store_(store), script_(std::move(script)) {
}

std::string ScriptHandle::Get(const util::Context& ctx) {
  {
    std::shared_lock lock(mutex_);
    if (!sha_.empty()) return sha_;
  }

  std::unique_lock lock(mutex_);
  if (!sha_.empty()) return sha_;
  return LoadLocked(ctx);
}

std::string ScriptHandle::Reload(const util::Context& ctx, const std::string& stale) {
  std::unique_lock lock(mutex_);
  if (!sha_.empty() && sha_ != stale) return sha_;

  TKV_LOG_WARN("script missing on store, registering again",
               {observability::StringField("script", script_.name), observability::StringField("store", store_.Name())});
  sha_.clear();
  return LoadLocked(ctx);
}

void ScriptHandle::Invalidate() {
  std::unique_lock lock(mutex_);
  sha_.clear();
}

std::string ScriptHandle::LoadLocked(const util::Context& ctx) {
  auto sha = store_.ScriptLoad(ctx, script_);
  sha_     = sha;
  TKV_LOG_INFO("registered script", {observability::StringField("script", script_.name),
                                     observability::StringField("sha", sha), observability::StringField("store", store_.Name())});
  return sha;
}

} // namespace tkv::core
