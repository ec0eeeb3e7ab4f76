#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/store/api/reply.hpp"
#include "internal/store/api/score.hpp"

namespace tkv::store {

/*
  Read commands available to a procedure while the store evaluates it.

  A backend hands one of these to the procedure body inside a single
  indivisible evaluation: no pipeline commits between the first and
  the last command the procedure issues.
*/
class ScriptContext {
 public:
  virtual ~ScriptContext() = default;

  virtual std::int64_t             ZCount(const std::string& set, const ScoreRange& range) = 0;
  virtual std::vector<std::string> ZRangeByScore(const std::string& set, const ScoreRange& range, std::int64_t offset,
                                                 std::int64_t count)                       = 0;
  virtual std::vector<std::optional<std::string>> MGet(const std::vector<std::string>& keys) = 0;
};

using ScriptBody =
    std::function<Reply(ScriptContext& store, const std::vector<std::string>& keys, const std::vector<std::string>& args)>;

/*
  A server-side procedure.

  Registered once per store with Store::ScriptLoad, invoked afterwards by
  the returned handle. The handle depends only on the name, so loading
  the same script twice yields the same handle.
*/
struct Script {
  std::string name;
  ScriptBody  body;
};

std::string ScriptDigest(const std::string& name);

/*
  Handle -> procedure table kept by every backend.
*/
class ScriptRegistry {
 public:
  std::string Load(const Script& script);

  // nullopt when the handle was never loaded or has been flushed.
  std::optional<ScriptBody> Find(const std::string& sha) const;

  void Flush();

 private:
  mutable std::shared_mutex                   mutex_;
  std::unordered_map<std::string, ScriptBody> scripts_;
};

} // namespace tkv::store
