#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace tkv::testing {

/*
  MemoryStore with hooks for tests.

  Counts ScriptLoad/EvalSha calls, can fail the next N loads, and can
  replace the EvalSha reply.
*/
class ForwardingStore final : public store::Store {
 public:
  const char* Name() const override {
    return "forwarding";
  }

  std::optional<std::string> Get(const util::Context& ctx, const std::string& key) override {
    return inner_.Get(ctx, key);
  }
  bool Exists(const util::Context& ctx, const std::string& key) override {
    return inner_.Exists(ctx, key);
  }
  std::vector<std::optional<std::string>> MGet(const util::Context& ctx, const std::vector<std::string>& keys) override {
    ++mget_calls;
    return inner_.MGet(ctx, keys);
  }
  std::int64_t ZCount(const util::Context& ctx, const std::string& set, const store::ScoreRange& range) override {
    return inner_.ZCount(ctx, set, range);
  }
  std::vector<std::string> ZRangeByScore(const util::Context& ctx, const std::string& set, const store::ScoreRange& range,
                                         std::int64_t offset, std::int64_t count) override {
    return inner_.ZRangeByScore(ctx, set, range, offset, count);
  }
  store::Result ExecTransaction(const util::Context& ctx, const std::vector<store::Command>& commands,
                                std::vector<std::int64_t>& replies) override {
    return inner_.ExecTransaction(ctx, commands, replies);
  }

  std::string ScriptLoad(const util::Context& ctx, const store::Script& script) override {
    ++loads;
    if (fail_loads > 0) {
      --fail_loads;
      throw util::StoreError(store::ErrorCode::IOError, "script load refused");
    }
    return inner_.ScriptLoad(ctx, script);
  }

  store::Reply EvalSha(const util::Context& ctx, const std::string& sha, const std::vector<std::string>& keys,
                       const std::vector<std::string>& args) override {
    ++evals;
    if (reply_override) return *reply_override;
    return inner_.EvalSha(ctx, sha, keys, args);
  }

  void ScriptFlush() override {
    inner_.ScriptFlush();
  }

  std::atomic<int>            loads{0};
  std::atomic<int>            evals{0};
  std::atomic<int>            mget_calls{0};
  std::atomic<int>            fail_loads{0};
  std::optional<store::Reply> reply_override;

 private:
  store::memory::MemoryStore inner_;
};

} // namespace tkv::testing
