#include "sqlite_store.hpp"

#include <limits>
#include <mutex>

#include "internal/store/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace tkv::store::sqlite {

namespace {

constexpr const char* kWrongType = "WRONGTYPE Operation against a key holding the wrong kind of value";

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
}

// ------------------------------------------------------------------
// Single-statement helpers. Caller holds the connection mutex.
// ------------------------------------------------------------------

bool RowExists(SqliteDB& db, const char* sql, const std::string& key) {
  StatementScope st(db.Prepare(sql));
  BindBlob(st.get(), 1, key);
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return true;
  ThrowIf(rc, db.Handle(), "sqlite exists");
  return false;
}

bool IsString(SqliteDB& db, const std::string& key) {
  return RowExists(db, sql::STRING_EXISTS, key);
}

bool IsZSet(SqliteDB& db, const std::string& key) {
  return RowExists(db, sql::ZSET_EXISTS, key);
}

std::int64_t Modify(SqliteDB& db, const char* sql, const std::string& key, const std::string* second = nullptr) {
  StatementScope st(db.Prepare(sql));
  BindBlob(st.get(), 1, key);
  if (second) BindBlob(st.get(), 2, *second);
  ThrowIf(sqlite3_step(st.get()), db.Handle(), "sqlite write");
  return sqlite3_changes(db.Handle());
}

std::optional<std::string> ReadString(SqliteDB& db, const std::string& key) {
  StatementScope st(db.Prepare(sql::SELECT_STRING));
  BindBlob(st.get(), 1, key);
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ColBlob(st.get(), 0);
  ThrowIf(rc, db.Handle(), "sqlite get");
  return std::nullopt;
}

std::optional<std::string> GetChecked(SqliteDB& db, const std::string& key) {
  auto value = ReadString(db, key);
  if (!value && IsZSet(db, key)) throw util::StoreError(ErrorCode::WrongType, kWrongType);
  return value;
}

std::vector<std::optional<std::string>> MGetRaw(SqliteDB& db, const std::vector<std::string>& keys) {
  std::vector<std::optional<std::string>> out;
  out.reserve(keys.size());
  for (const auto& key : keys) {
    out.push_back(ReadString(db, key));
  }
  return out;
}

void CheckSet(SqliteDB& db, const std::string& set) {
  if (IsString(db, set)) throw util::StoreError(ErrorCode::WrongType, kWrongType);
}

std::int64_t MinBound(const ScoreRange& r) {
  return r.min.value_or(std::numeric_limits<std::int64_t>::min());
}

std::int64_t MaxBound(const ScoreRange& r) {
  return r.max.value_or(std::numeric_limits<std::int64_t>::max());
}

std::int64_t ZCountRaw(SqliteDB& db, const std::string& set, const ScoreRange& range) {
  CheckSet(db, set);
  if (range.IsEmpty()) return 0;

  StatementScope st(db.Prepare(sql::COUNT_ZRANGE));
  BindBlob(st.get(), 1, set);
  BindI64(st.get(), 2, MinBound(range));
  BindI64(st.get(), 3, MaxBound(range));
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIf(rc, db.Handle(), "sqlite zcount");
    throw util::StoreError(ErrorCode::InternalError, "sqlite zcount: no row");
  }
  return sqlite3_column_int64(st.get(), 0);
}

std::vector<std::string> ZRangeRaw(SqliteDB& db, const std::string& set, const ScoreRange& range, std::int64_t offset,
                                   std::int64_t count) {
  CheckSet(db, set);
  std::vector<std::string> out;
  if (range.IsEmpty() || offset < 0 || count == 0) return out;

  StatementScope st(db.Prepare(sql::SELECT_ZRANGE));
  BindBlob(st.get(), 1, set);
  BindI64(st.get(), 2, MinBound(range));
  BindI64(st.get(), 3, MaxBound(range));
  BindI64(st.get(), 4, count < 0 ? -1 : count);
  BindI64(st.get(), 5, offset);

  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ColBlob(st.get(), 0));
  }
  ThrowIf(rc, db.Handle(), "sqlite zrangebyscore");
  return out;
}

std::int64_t Apply(SqliteDB& db, const Command& c) {
  switch (c.op) {
    case Command::Op::Set:
      Modify(db, sql::DELETE_ZSET, c.key);
      Modify(db, sql::UPSERT_STRING, c.key, &c.value);
      return 1;

    case Command::Op::Del: {
      auto removed = Modify(db, sql::DELETE_STRING, c.key);
      return removed + (Modify(db, sql::DELETE_ZSET, c.key) > 0 ? 1 : 0);
    }

    case Command::Op::ZAdd: {
      CheckSet(db, c.key);

      bool existed = false;
      {
        StatementScope st(db.Prepare(sql::SELECT_ZSCORE));
        BindBlob(st.get(), 1, c.key);
        BindBlob(st.get(), 2, c.member);
        int rc = sqlite3_step(st.get());
        if (rc == SQLITE_ROW) {
          existed = true;
        } else {
          ThrowIf(rc, db.Handle(), "sqlite zscore");
        }
      }

      StatementScope st(db.Prepare(sql::UPSERT_ZMEMBER));
      BindBlob(st.get(), 1, c.key);
      BindBlob(st.get(), 2, c.member);
      BindI64(st.get(), 3, c.score);
      ThrowIf(sqlite3_step(st.get()), db.Handle(), "sqlite zadd");
      return existed ? 0 : 1;
    }

    case Command::Op::ZRem:
      CheckSet(db, c.key);
      return Modify(db, sql::DELETE_ZMEMBER, c.key, &c.member);
  }
  return 0;
}

} // namespace

// ------------------------------------------------------------------
// Script evaluation
// ------------------------------------------------------------------

class SqliteStore::Evaluation final : public ScriptContext {
 public:
  explicit Evaluation(SqliteDB& db) : db_(db) {
  }

  std::int64_t ZCount(const std::string& set, const ScoreRange& range) override {
    return ZCountRaw(db_, set, range);
  }

  std::vector<std::string> ZRangeByScore(const std::string& set, const ScoreRange& range, std::int64_t offset,
                                         std::int64_t count) override {
    return ZRangeRaw(db_, set, range, offset, count);
  }

  std::vector<std::optional<std::string>> MGet(const std::vector<std::string>& keys) override {
    return MGetRaw(db_, keys);
  }

 private:
  SqliteDB& db_;
};

// ------------------------------------------------------------------
// Store
// ------------------------------------------------------------------

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteStore::Bootstrap() {
  std::lock_guard lock(db_->Mutex());
  for (const char* stmt : sql::kSqliteSchema) {
    db_->Exec(stmt);
  }
}

std::optional<std::string> SqliteStore::Get(const util::Context& ctx, const std::string& key) {
  ctx.ThrowIfDone();
  std::lock_guard lock(db_->Mutex());
  return GetChecked(*db_, key);
}

bool SqliteStore::Exists(const util::Context& ctx, const std::string& key) {
  ctx.ThrowIfDone();
  std::lock_guard lock(db_->Mutex());
  return IsString(*db_, key) || IsZSet(*db_, key);
}

std::vector<std::optional<std::string>> SqliteStore::MGet(const util::Context& ctx, const std::vector<std::string>& keys) {
  ctx.ThrowIfDone();
  std::lock_guard lock(db_->Mutex());
  return MGetRaw(*db_, keys);
}

std::int64_t SqliteStore::ZCount(const util::Context& ctx, const std::string& set, const ScoreRange& range) {
  ctx.ThrowIfDone();
  std::lock_guard lock(db_->Mutex());
  return ZCountRaw(*db_, set, range);
}

std::vector<std::string> SqliteStore::ZRangeByScore(const util::Context& ctx, const std::string& set, const ScoreRange& range,
                                                    std::int64_t offset, std::int64_t count) {
  ctx.ThrowIfDone();
  std::lock_guard lock(db_->Mutex());
  return ZRangeRaw(*db_, set, range, offset, count);
}

Result SqliteStore::ExecTransaction(const util::Context& ctx, const std::vector<Command>& commands,
                                    std::vector<std::int64_t>& replies) {
  if (auto err = ctx.Err(); !err) return err;

  std::lock_guard lock(db_->Mutex());
  try {
    SqliteTransaction tx(*db_, SqliteTransaction::Mode::Immediate);

    std::vector<std::int64_t> out;
    out.reserve(commands.size());
    for (const auto& c : commands) {
      if (auto err = ctx.Err(); !err) return err;
      out.push_back(Apply(*db_, c));
    }

    tx.Commit();
    replies = std::move(out);
    return Result::Ok();
  } catch (const util::StoreError& e) {
    return e.ToResult();
  }
}

std::string SqliteStore::ScriptLoad(const util::Context& ctx, const Script& script) {
  ctx.ThrowIfDone();
  return scripts_.Load(script);
}

Reply SqliteStore::EvalSha(const util::Context& ctx, const std::string& sha, const std::vector<std::string>& keys,
                           const std::vector<std::string>& args) {
  ctx.ThrowIfDone();

  auto body = scripts_.Find(sha);
  if (!body) throw util::StoreError(ErrorCode::NoScript, "NOSCRIPT No matching script");

  std::lock_guard   lock(db_->Mutex());
  SqliteTransaction tx(*db_, SqliteTransaction::Mode::Deferred);
  Evaluation        eval(*db_);
  auto              reply = (*body)(eval, keys, args);
  tx.Commit();
  return reply;
}

void SqliteStore::ScriptFlush() {
  scripts_.Flush();
}

} // namespace tkv::store::sqlite
