#include "script.hpp"

#include <mutex>

namespace tkv::store {

std::string ScriptDigest(const std::string& name) {
  // 64-bit FNV-1a, hex encoded
  std::uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : name) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[i] = kHex[hash & 0x0F];
    hash >>= 4;
  }
  return out;
}

std::string ScriptRegistry::Load(const Script& script) {
  auto sha = ScriptDigest(script.name);

  std::unique_lock lock(mutex_);
  scripts_[sha] = script.body;
  return sha;
}

std::optional<ScriptBody> ScriptRegistry::Find(const std::string& sha) const {
  std::shared_lock lock(mutex_);

  auto it = scripts_.find(sha);
  if (it == scripts_.end()) return std::nullopt;
  return it->second;
}

void ScriptRegistry::Flush() {
  std::unique_lock lock(mutex_);
  scripts_.clear();
}

} // namespace tkv::store
