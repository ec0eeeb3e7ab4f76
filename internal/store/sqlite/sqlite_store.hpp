#pragma once

#include <memory>

#include "internal/store/api/store.hpp"
#include "sqlite_db.hpp"

namespace tkv::store::sqlite {

/*
  Store backed by a single SQLite database file.

  Tables (see sql/sql_queries.hpp):
    kv_string(key, value)
    kv_zset(set_key, member, score)

  Every call holds the connection mutex:
    ExecTransaction -> BEGIN IMMEDIATE ... COMMIT
    EvalSha         -> BEGIN ... COMMIT (read snapshot)
*/
class SqliteStore final : public store::Store {
 public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  const char* Name() const override {
    return "sqlite";
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

 private:
  class Evaluation;

  std::shared_ptr<SqliteDB> db_;
  ScriptRegistry            scripts_;
};

} // namespace tkv::store::sqlite
