#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/api/result.hpp"
#include "internal/store/api/script.hpp"
#include "internal/util/context.hpp"

namespace tkv::store {

/*
  One write queued in a transactional pipeline.

  Replies (see Store::ExecTransaction):
    Set  -> 1
    Del  -> number of keys removed (0 or 1)
    ZAdd -> number of members added, 0 when an existing score was updated
    ZRem -> number of members removed (0 or 1)
*/
struct Command {
  enum class Op { Set, Del, ZAdd, ZRem };

  Op           op = Op::Set;
  std::string  key;
  std::string  member;
  std::string  value;
  std::int64_t score = 0;
};

/*
  Score-ordered key/value store.

  CRITICAL GUARANTEES (all backends):

  - ExecTransaction applies every command or none of them
  - EvalSha runs the procedure as one indivisible evaluation
  - Range commands order by (score, member) ascending
  - Reads and EvalSha throw util::StoreError on failure
  - Every call checks the Context before touching data

  A key holds either a string or a sorted set.
*/
class Store {
 public:
  virtual ~Store() = default;

  virtual const char* Name() const = 0;

  // ---------------------------------------------------------------------
  // Strings
  // ---------------------------------------------------------------------

  virtual std::optional<std::string>              Get(const util::Context& ctx, const std::string& key)                = 0;
  virtual bool                                    Exists(const util::Context& ctx, const std::string& key)             = 0;
  virtual std::vector<std::optional<std::string>> MGet(const util::Context& ctx, const std::vector<std::string>& keys) = 0;

  // ---------------------------------------------------------------------
  // Sorted sets
  // ---------------------------------------------------------------------

  virtual std::int64_t ZCount(const util::Context& ctx, const std::string& set, const ScoreRange& range) = 0;

  // offset < 0 yields nothing, count < 0 means no limit.
  virtual std::vector<std::string> ZRangeByScore(const util::Context& ctx, const std::string& set, const ScoreRange& range,
                                                 std::int64_t offset, std::int64_t count) = 0;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // replies is resized to commands.size() on success.
  virtual Result ExecTransaction(const util::Context& ctx, const std::vector<Command>& commands,
                                 std::vector<std::int64_t>& replies) = 0;

  // ---------------------------------------------------------------------
  // Scripts
  // ---------------------------------------------------------------------

  virtual std::string ScriptLoad(const util::Context& ctx, const Script& script) = 0;

  // Throws StoreError(NoScript) for an unknown handle.
  virtual Reply EvalSha(const util::Context& ctx, const std::string& sha, const std::vector<std::string>& keys,
                        const std::vector<std::string>& args) = 0;

  virtual void ScriptFlush() = 0;
};

} // namespace tkv::store
