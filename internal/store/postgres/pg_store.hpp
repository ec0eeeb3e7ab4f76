#pragma once

#include <memory>

#include "internal/store/api/store.hpp"
#include "pg_pool.hpp"

namespace tkv::store::postgres {

/*
  Store backed by PostgreSQL through libpqxx.

  Same layout as the SQLite backend (BYTEA keys, BIGINT scores).
  Each call checks out its own pooled connection:
    reads           -> single statement transaction
    ExecTransaction -> one read-committed transaction
    EvalSha         -> one repeatable-read read-only transaction
*/
class PgStore final : public store::Store {
 public:
  explicit PgStore(std::shared_ptr<PgPool> pool);

  const char* Name() const override {
    return "postgres";
  }

  // Creates the tables when missing.
  void Bootstrap();

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

  static Result Translate(const std::exception& e);

 private:
  class Evaluation;

  std::shared_ptr<PgPool> pool_;
  ScriptRegistry          scripts_;
};

} // namespace tkv::store::postgres
