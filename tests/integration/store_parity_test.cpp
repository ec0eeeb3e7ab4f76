#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/paginate.hpp"
#include "internal/core/timestamped_kv.hpp"
#include "internal/store/api/pipeline.hpp"
#include "internal/store/api/store.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

#if TKV_DB_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_store.hpp"
#endif

#if TKV_DB_POSTGRES
#include "internal/store/postgres/pg_pool.hpp"
#include "internal/store/postgres/pg_store.hpp"
#endif

namespace {

using tkv::core::BulkSetRecord;
using tkv::core::Paginate;
using tkv::core::TimeRange;
using tkv::core::TimestampedKv;
using tkv::keys::KeyComposer;
using tkv::store::ErrorCode;
using tkv::store::Reply;
using tkv::store::Script;
using tkv::store::ScriptContext;
using tkv::store::ScoreRange;
using tkv::store::Store;
using tkv::store::TxPipeline;
using tkv::util::Context;
using tkv::util::StoreError;

tkv::util::TimePoint At(int second) {
  return tkv::util::FromUnixNanos(1'600'000'000'000'000'000) + std::chrono::seconds(second);
}

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Store>()>      make_store;
  std::function<bool()>                        supports_restart;
  std::function<void(std::shared_ptr<Store>&)> restart;
  std::function<void()>                        cleanup;
};

template <typename Fn>
ErrorCode CodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const StoreError& e) {
    return e.code();
  }
  return ErrorCode::OK;
}

void VerifyStrings(Store& store) {
  auto ctx = Context::Background();

  assert(!store.Get(ctx, "s:missing").has_value());
  assert(!store.Exists(ctx, "s:missing"));

  TxPipeline pipe(store);
  auto       set_a = pipe.Set("s:a", "alpha");
  pipe.Set("s:b", std::string("b\0\x1f", 3));
  auto del_missing = pipe.Del("s:missing");
  assert(pipe.Exec(ctx));
  assert(pipe.Reply(set_a) == 1);
  assert(pipe.Reply(del_missing) == 0);

  assert(*store.Get(ctx, "s:a") == "alpha");
  assert(*store.Get(ctx, "s:b") == std::string("b\0\x1f", 3));
  assert(store.Exists(ctx, "s:a"));

  auto values = store.MGet(ctx, {"s:b", "s:missing", "s:a"});
  assert(values.size() == 3);
  assert(*values[0] == std::string("b\0\x1f", 3));
  assert(!values[1]);
  assert(*values[2] == "alpha");

  TxPipeline overwrite(store);
  overwrite.Set("s:a", "");
  auto del = overwrite.Del("s:b");
  assert(overwrite.Exec(ctx));
  assert(overwrite.Reply(del) == 1);
  assert(store.Get(ctx, "s:a")->empty());
  assert(!store.Exists(ctx, "s:b"));
}

void VerifySortedSets(Store& store) {
  auto ctx = Context::Background();

  TxPipeline pipe(store);
  auto       first = pipe.ZAdd("z", "b", 5);
  pipe.ZAdd("z", "a", 5);
  pipe.ZAdd("z", "c", -3);
  pipe.ZAdd("z", "d", 9);
  auto update = pipe.ZAdd("z", "d", 10);
  assert(pipe.Exec(ctx));
  assert(pipe.Reply(first) == 1);
  assert(pipe.Reply(update) == 0);

  assert(store.ZCount(ctx, "z", ScoreRange{}) == 4);
  assert(store.ZCount(ctx, "z", ScoreRange{5, 5}) == 2);
  assert(store.ZCount(ctx, "z", ScoreRange{6, 9}) == 0);
  assert(store.ZCount(ctx, "z", ScoreRange{7, 3}) == 0);
  assert(store.ZCount(ctx, "z:none", ScoreRange{}) == 0);

  auto all = store.ZRangeByScore(ctx, "z", ScoreRange{}, 0, -1);
  assert((all == std::vector<std::string>{"c", "a", "b", "d"}));

  auto window = store.ZRangeByScore(ctx, "z", ScoreRange{0, std::nullopt}, 1, 2);
  assert((window == std::vector<std::string>{"b", "d"}));

  assert(store.ZRangeByScore(ctx, "z", ScoreRange{}, 4, 10).empty());
  assert(store.ZRangeByScore(ctx, "z", ScoreRange{}, 0, 0).empty());
  assert(store.ZRangeByScore(ctx, "z", ScoreRange{}, -1, 10).empty());

  TxPipeline rem(store);
  auto       removed = rem.ZRem("z", "a");
  auto       absent  = rem.ZRem("z", "a");
  assert(rem.Exec(ctx));
  assert(rem.Reply(removed) == 1);
  assert(rem.Reply(absent) == 0);
  assert(store.ZCount(ctx, "z", ScoreRange{}) == 3);
}

void VerifyTypeErrorsAreAtomic(Store& store) {
  auto ctx = Context::Background();

  TxPipeline seed(store);
  seed.Set("t:string", "v");
  seed.ZAdd("t:set", "m", 1);
  assert(seed.Exec(ctx));

  TxPipeline bad(store);
  bad.Set("t:first", "should not stick");
  bad.ZAdd("t:string", "m", 1);
  auto result = bad.Exec(ctx);
  assert(!result);
  assert(result.code == ErrorCode::WrongType);
  assert(!store.Exists(ctx, "t:first"));

  assert(CodeOf([&] { (void)store.Get(ctx, "t:set"); }) == ErrorCode::WrongType);
  assert(CodeOf([&] { (void)store.ZCount(ctx, "t:string", ScoreRange{}); }) == ErrorCode::WrongType);

  // SET replaces a sorted set
  TxPipeline replace(store);
  replace.Set("t:set", "now a string");
  assert(replace.Exec(ctx));
  assert(*store.Get(ctx, "t:set") == "now a string");
  assert(store.MGet(ctx, {"t:set"})[0].has_value());
}

void VerifyScripts(Store& store) {
  auto ctx = Context::Background();

  auto body = [](ScriptContext& s, const std::vector<std::string>& keys, const std::vector<std::string>& args) {
    auto members = s.ZRangeByScore(keys[0], ScoreRange{}, 0, -1);
    return Reply::Array({Reply::Integer(s.ZCount(keys[0], ScoreRange{})), Reply::FromValues(s.MGet(members)),
                         Reply::String(args.empty() ? "" : args[0])});
  };

  auto sha = store.ScriptLoad(ctx, Script{"parity.echo", body});
  assert(sha == tkv::store::ScriptDigest("parity.echo"));
  assert(store.ScriptLoad(ctx, Script{"parity.echo", body}) == sha);

  TxPipeline pipe(store);
  pipe.Set("sc:k1", "v1");
  pipe.ZAdd("sc:idx", "sc:k1", 1);
  pipe.ZAdd("sc:idx", "sc:k2", 2);
  assert(pipe.Exec(ctx));

  auto reply = store.EvalSha(ctx, sha, {"sc:idx"}, {"arg"});
  assert(reply.elements()[0].integer() == 2);
  const auto& values = reply.elements()[1].elements();
  assert(values[0].str() == "v1");
  assert(values[1].IsNil());
  assert(reply.elements()[2].str() == "arg");

  assert(CodeOf([&] { (void)store.EvalSha(ctx, "ffffffffffffffff", {}, {}); }) == ErrorCode::NoScript);

  store.ScriptFlush();
  assert(CodeOf([&] { (void)store.EvalSha(ctx, sha, {"sc:idx"}, {}); }) == ErrorCode::NoScript);
}

void VerifyCancellation(Store& store) {
  Context ctx;
  ctx.Cancel();

  std::vector<std::int64_t> replies;
  tkv::store::Command       c;
  c.key   = "x:cancelled";
  c.value = "v";
  assert(store.ExecTransaction(ctx, {c}, replies).code == ErrorCode::Cancelled);
  assert(!store.Exists(Context::Background(), "x:cancelled"));

  assert(CodeOf([&] { (void)store.Get(ctx, "x"); }) == ErrorCode::Cancelled);
  assert(CodeOf([&] { (void)store.MGet(ctx, {"x"}); }) == ErrorCode::Cancelled);

  auto expired = Context::WithTimeout(std::chrono::nanoseconds(0));
  assert(CodeOf([&] { (void)store.ZCount(expired, "z", ScoreRange{}); }) == ErrorCode::DeadlineExceeded);
}

void VerifyRecords(const std::shared_ptr<Store>& store, const std::string& ns) {
  auto          ctx = Context::Background();
  TimestampedKv kv(store, KeyComposer(std::string(tkv::keys::kDelimUnit), ns));

  std::vector<BulkSetRecord> records;
  for (int i = 0; i < 9; ++i) {
    records.push_back({At(i), {"r", std::to_string(i)}, "payload-" + std::to_string(i)});
  }
  kv.BulkSet(ctx, records);

  assert(kv.Set(ctx, "payload-4b", At(4), {"r", "4"}));
  assert(!kv.Set(ctx, "payload-9", At(9), {"r", "9"}));
  kv.Delete(ctx, {"r", "0"});

  TimeRange window{At(1), At(8)};
  for (auto consistent : {false, true}) {
    auto page = consistent ? kv.FetchPageConsistent(ctx, window, 0, 3) : kv.FetchPage(ctx, window, 0, 3);
    assert(page.total == 8);

    std::vector<std::string> got;
    while (page.cursor->Next()) got.push_back(page.cursor->Current().Copy());
    assert((got == std::vector<std::string>{"payload-1", "payload-2", "payload-3"}));

    auto fn     = consistent ? kv.ConsistentPageFn() : kv.PageFn();
    auto cursor = Paginate(ctx, fn, window, 0, 3);

    std::vector<std::string> all;
    while (cursor->Next()) {
      assert(cursor->Current().ok());
      all.push_back(cursor->Current().Copy());
    }
    assert(all.size() == 8);
    assert(all[3] == "payload-4b");
    assert(all.back() == "payload-8");
  }

  assert(!kv.Exists(ctx, {"r", "0"}));
  assert(kv.FetchPageConsistent(ctx, TimeRange{}, 0, 100).total == 9);
}

void VerifyConcurrentWriters(const std::shared_ptr<Store>& store, const std::string& ns) {
  TimestampedKv kv(store, KeyComposer("|", ns));

  constexpr int            kThreads    = 4;
  constexpr int            kPerThread  = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&kv, t] {
      auto ctx = Context::Background();
      for (int i = 0; i < kPerThread; ++i) {
        kv.Set(ctx, "v", At(i), {std::to_string(t), std::to_string(i)});
        auto page = kv.FetchPageConsistent(ctx, TimeRange{}, 0, 5);
        assert(page.total >= 1);
      }
    });
  }
  for (auto& th : threads) th.join();

  assert(kv.FetchPage(Context::Background(), TimeRange{}, 0, 0).total == kThreads * kPerThread);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  {
    TimestampedKv kv(store, KeyComposer("|", "durable"));
    kv.Set(Context::Background(), "kept", At(1), {"d"});
  }

  backend.restart(store);

  TimestampedKv kv(store, KeyComposer("|", "durable"));
  assert(*kv.Get(Context::Background(), {"d"}) == "kept");

  auto page = kv.FetchPageConsistent(Context::Background(), TimeRange{}, 0, 10);
  assert(page.total == 1);
  assert(page.cursor->Next() && page.cursor->Current().View() == "kept");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<tkv::store::memory::MemoryStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Store>&) {},
      .cleanup          = []() {},
  };
}

#if TKV_DB_SQLITE
std::int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("tkv_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() -> std::shared_ptr<Store> {
    auto db    = std::make_shared<tkv::store::sqlite::SqliteDB>(db_path);
    auto store = std::make_shared<tkv::store::sqlite::SqliteStore>(std::move(db));
    store->Bootstrap();
    return store;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<Store>& store) {
        store.reset();
        store = make_store();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if TKV_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TKV_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TKV_TEST_POSTGRES_URI is not set");
  }

  auto conninfo   = std::string(uri);
  auto make_store = [conninfo]() -> std::shared_ptr<Store> {
    auto pool  = std::make_shared<tkv::store::postgres::PgPool>(conninfo);
    auto store = std::make_shared<tkv::store::postgres::PgStore>(pool);
    store->Bootstrap();
    return store;
  };

  // start from empty tables
  {
    (void)make_store();
    auto       pool = std::make_shared<tkv::store::postgres::PgPool>(conninfo, 1);
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    tx.exec0("TRUNCATE kv_string, kv_zset;");
    tx.commit();
  }

  return BackendFactory{
      .name             = "postgres",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<Store>& store) { store = make_store(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto store = backend.make_store();

  VerifyStrings(*store);
  VerifySortedSets(*store);
  VerifyTypeErrorsAreAtomic(*store);
  VerifyScripts(*store);
  VerifyCancellation(*store);
  VerifyRecords(store, backend.name + "-records");
  VerifyConcurrentWriters(store, backend.name + "-concurrent");

  store.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TKV_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TKV_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "tkv_integration_store_parity: pass\n";
  return 0;
}
