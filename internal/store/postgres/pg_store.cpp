#include "pg_store.hpp"

#include <cstddef>
#include <limits>

#include "internal/store/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "pg_tx.hpp"

namespace tkv::store::postgres {

namespace {

constexpr const char* kWrongType = "WRONGTYPE Operation against a key holding the wrong kind of value";

using Bytes     = std::basic_string<std::byte>;
using BytesView = std::basic_string_view<std::byte>;

BytesView AsBytes(const std::string& s) {
  return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

std::string FromBytes(const pqxx::field& f) {
  auto b = f.as<Bytes>();
  return std::string(reinterpret_cast<const char*>(b.data()), b.size());
}

bool IsString(pqxx::transaction_base& tx, const std::string& key) {
  return !tx.exec_prepared("string_exists", AsBytes(key)).empty();
}

bool IsZSet(pqxx::transaction_base& tx, const std::string& key) {
  return !tx.exec_prepared("zset_exists", AsBytes(key)).empty();
}

void CheckSet(pqxx::transaction_base& tx, const std::string& set) {
  if (IsString(tx, set)) throw util::StoreError(ErrorCode::WrongType, kWrongType);
}

std::optional<std::string> ReadString(pqxx::transaction_base& tx, const std::string& key) {
  auto res = tx.exec_prepared("select_string", AsBytes(key));
  if (res.empty()) return std::nullopt;
  return FromBytes(res[0][0]);
}

std::vector<std::optional<std::string>> MGetRaw(pqxx::transaction_base& tx, const std::vector<std::string>& keys) {
  std::vector<std::optional<std::string>> out;
  out.reserve(keys.size());
  for (const auto& key : keys) {
    out.push_back(ReadString(tx, key));
  }
  return out;
}

std::int64_t ZCountRaw(pqxx::transaction_base& tx, const std::string& set, const ScoreRange& range) {
  CheckSet(tx, set);
  if (range.IsEmpty()) return 0;

  auto res = tx.exec_prepared1("count_zrange", AsBytes(set), range.min.value_or(std::numeric_limits<std::int64_t>::min()),
                               range.max.value_or(std::numeric_limits<std::int64_t>::max()));
  return res[0].as<std::int64_t>();
}

std::vector<std::string> ZRangeRaw(pqxx::transaction_base& tx, const std::string& set, const ScoreRange& range,
                                   std::int64_t offset, std::int64_t count) {
  CheckSet(tx, set);
  std::vector<std::string> out;
  if (range.IsEmpty() || offset < 0 || count == 0) return out;

  const auto min = range.min.value_or(std::numeric_limits<std::int64_t>::min());
  const auto max = range.max.value_or(std::numeric_limits<std::int64_t>::max());

  auto res = count < 0 ? tx.exec_prepared("select_zrange_all", AsBytes(set), min, max, offset)
                       : tx.exec_prepared("select_zrange", AsBytes(set), min, max, count, offset);
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(FromBytes(row[0]));
  }
  return out;
}

std::int64_t Apply(pqxx::transaction_base& tx, const Command& c) {
  switch (c.op) {
    case Command::Op::Set:
      tx.exec_prepared0("delete_zset", AsBytes(c.key));
      tx.exec_prepared0("upsert_string", AsBytes(c.key), AsBytes(c.value));
      return 1;

    case Command::Op::Del: {
      auto strings = tx.exec_prepared0("delete_string", AsBytes(c.key)).affected_rows();
      auto members = tx.exec_prepared0("delete_zset", AsBytes(c.key)).affected_rows();
      return static_cast<std::int64_t>(strings) + (members > 0 ? 1 : 0);
    }

    case Command::Op::ZAdd: {
      CheckSet(tx, c.key);
      auto row = tx.exec_prepared1("upsert_zmember", AsBytes(c.key), AsBytes(c.member), c.score);
      return row[0].as<bool>() ? 1 : 0;
    }

    case Command::Op::ZRem:
      CheckSet(tx, c.key);
      return static_cast<std::int64_t>(
          tx.exec_prepared0("delete_zmember", AsBytes(c.key), AsBytes(c.member)).affected_rows());
  }
  return 0;
}

// Runs fn and rethrows driver exceptions as StoreError.
template <typename Fn>
auto Guard(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StoreError(PgStore::Translate(e));
  }
}

} // namespace

// ------------------------------------------------------------------
// Script evaluation
// ------------------------------------------------------------------

class PgStore::Evaluation final : public ScriptContext {
 public:
  explicit Evaluation(pqxx::transaction_base& tx) : tx_(tx) {
  }

  std::int64_t ZCount(const std::string& set, const ScoreRange& range) override {
    return ZCountRaw(tx_, set, range);
  }

  std::vector<std::string> ZRangeByScore(const std::string& set, const ScoreRange& range, std::int64_t offset,
                                         std::int64_t count) override {
    return ZRangeRaw(tx_, set, range, offset, count);
  }

  std::vector<std::optional<std::string>> MGet(const std::vector<std::string>& keys) override {
    return MGetRaw(tx_, keys);
  }

 private:
  pqxx::transaction_base& tx_;
};

// ------------------------------------------------------------------
// Store
// ------------------------------------------------------------------

PgStore::PgStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

Result PgStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgStore::Bootstrap() {
  Guard([&] {
    PgTransaction tx(*pool_, PgTransaction::Mode::ReadWrite);
    for (const char* stmt : sql::kPostgresSchema) {
      tx.Work().exec0(stmt);
    }
    tx.Commit();
  });
}

std::optional<std::string> PgStore::Get(const util::Context& ctx, const std::string& key) {
  ctx.ThrowIfDone();
  return Guard([&] {
    PgTransaction tx(*pool_, PgTransaction::Mode::Snapshot);
    auto          value = ReadString(tx.Work(), key);
    if (!value && IsZSet(tx.Work(), key)) throw util::StoreError(ErrorCode::WrongType, kWrongType);
    tx.Commit();
    return value;
  });
}

bool PgStore::Exists(const util::Context& ctx, const std::string& key) {
  ctx.ThrowIfDone();
  return Guard([&] {
    PgTransaction tx(*pool_, PgTransaction::Mode::Snapshot);
    bool          found = IsString(tx.Work(), key) || IsZSet(tx.Work(), key);
    tx.Commit();
    return found;
  });
}

std::vector<std::optional<std::string>> PgStore::MGet(const util::Context& ctx, const std::vector<std::string>& keys) {
  ctx.ThrowIfDone();
  return Guard([&] {
    PgTransaction tx(*pool_, PgTransaction::Mode::Snapshot);
    auto          values = MGetRaw(tx.Work(), keys);
    tx.Commit();
    return values;
  });
}

std::int64_t PgStore::ZCount(const util::Context& ctx, const std::string& set, const ScoreRange& range) {
  ctx.ThrowIfDone();
  return Guard([&] {
    PgTransaction tx(*pool_, PgTransaction::Mode::Snapshot);
    auto          n = ZCountRaw(tx.Work(), set, range);
    tx.Commit();
    return n;
  });
}

std::vector<std::string> PgStore::ZRangeByScore(const util::Context& ctx, const std::string& set, const ScoreRange& range,
                                                std::int64_t offset, std::int64_t count) {
  ctx.ThrowIfDone();
  return Guard([&] {
    PgTransaction tx(*pool_, PgTransaction::Mode::Snapshot);
    auto          members = ZRangeRaw(tx.Work(), set, range, offset, count);
    tx.Commit();
    return members;
  });
}

Result PgStore::ExecTransaction(const util::Context& ctx, const std::vector<Command>& commands,
                                std::vector<std::int64_t>& replies) {
  if (auto err = ctx.Err(); !err) return err;

  try {
    PgTransaction tx(*pool_, PgTransaction::Mode::ReadWrite);

    std::vector<std::int64_t> out;
    out.reserve(commands.size());
    for (const auto& c : commands) {
      if (auto err = ctx.Err(); !err) return err;
      out.push_back(Apply(tx.Work(), c));
    }

    tx.Commit();
    replies = std::move(out);
    return Result::Ok();
  } catch (const util::StoreError& e) {
    return e.ToResult();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::string PgStore::ScriptLoad(const util::Context& ctx, const Script& script) {
  ctx.ThrowIfDone();
  return scripts_.Load(script);
}

Reply PgStore::EvalSha(const util::Context& ctx, const std::string& sha, const std::vector<std::string>& keys,
                       const std::vector<std::string>& args) {
  ctx.ThrowIfDone();

  auto body = scripts_.Find(sha);
  if (!body) throw util::StoreError(ErrorCode::NoScript, "NOSCRIPT No matching script");

  return Guard([&] {
    PgTransaction tx(*pool_, PgTransaction::Mode::Snapshot);
    Evaluation    eval(tx.Work());
    auto          reply = (*body)(eval, keys, args);
    tx.Commit();
    return reply;
  });
}

void PgStore::ScriptFlush() {
  scripts_.Flush();
}

} // namespace tkv::store::postgres
