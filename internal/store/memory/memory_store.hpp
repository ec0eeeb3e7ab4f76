#pragma once

#include <cstdint>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/store/api/store.hpp"

namespace tkv::store::memory {

/*
  In-process store.

  One shared_mutex guards the whole keyspace:
    reads and script evaluation  -> shared lock
    transactions                 -> exclusive lock

  Transactions are validated before the first command applies, so a
  type error leaves the keyspace untouched.
*/
class MemoryStore final : public store::Store {
 public:
  MemoryStore();

  const char* Name() const override {
    return "memory";
  }

  std::optional<std::string>              Get(const util::Context& ctx, const std::string& key) override;
  bool                                    Exists(const util::Context& ctx, const std::string& key) override;
  std::vector<std::optional<std::string>> MGet(const util::Context& ctx, const std::vector<std::string>& keys) override;

  std::int64_t             ZCount(const util::Context& ctx, const std::string& set, const ScoreRange& range) override;
  std::vector<std::string> ZRangeByScore(const util::Context& ctx, const std::string& set, const ScoreRange& range,
                                         std::int64_t offset, std::int64_t count) override;

  Result ExecTransaction(const util::Context& ctx, const std::vector<Command>& commands,
                         std::vector<std::int64_t>& replies) override;

  std::string ScriptLoad(const util::Context& ctx, const Script& script) override;
  Reply       EvalSha(const util::Context& ctx, const std::string& sha, const std::vector<std::string>& keys,
                      const std::vector<std::string>& args) override;
  void        ScriptFlush() override;

 private:
  class Evaluation;

  struct SortedSet {
    std::unordered_map<std::string, std::int64_t>  scores;
    std::set<std::pair<std::int64_t, std::string>> ordered;

    // true when the member is new
    bool Add(const std::string& member, std::int64_t score);
    bool Remove(const std::string& member);

    std::int64_t             Count(const ScoreRange& range) const;
    std::vector<std::string> Range(const ScoreRange& range, std::int64_t offset, std::int64_t count) const;
  };

  struct State {
    std::unordered_map<std::string, std::string> strings;
    std::unordered_map<std::string, SortedSet>   zsets;
  };

  static std::optional<std::string>              GetLocked(const State& s, const std::string& key);
  static std::vector<std::optional<std::string>> MGetLocked(const State& s, const std::vector<std::string>& keys);
  static const SortedSet*                        FindSet(const State& s, const std::string& key);

  static Result Validate(const State& s, const std::vector<Command>& commands);
  static std::int64_t Apply(State& s, const Command& command);

  mutable std::shared_mutex mutex_;
  State                     state_;
  ScriptRegistry            scripts_;
};

} // namespace tkv::store::memory
