#include "internal/store/memory/memory_store.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using tkv::store::Command;
using tkv::store::ErrorCode;
using tkv::store::Reply;
using tkv::store::Script;
using tkv::store::ScriptContext;
using tkv::store::ScoreRange;
using tkv::store::memory::MemoryStore;
using tkv::util::Context;
using tkv::util::StoreError;

Command Set(std::string key, std::string value) {
  Command c;
  c.op    = Command::Op::Set;
  c.key   = std::move(key);
  c.value = std::move(value);
  return c;
}

Command ZAdd(std::string set, std::string member, std::int64_t score) {
  Command c;
  c.op     = Command::Op::ZAdd;
  c.key    = std::move(set);
  c.member = std::move(member);
  c.score  = score;
  return c;
}

void TestTypeErrorLeavesKeyspaceUntouched() {
  MemoryStore store;
  auto        ctx = Context::Background();

  std::vector<std::int64_t> replies;
  assert(store.ExecTransaction(ctx, {Set("s", "v")}, replies));

  // second command hits a string key: nothing applies
  auto result = store.ExecTransaction(ctx, {Set("a", "1"), ZAdd("s", "m", 1)}, replies);
  assert(!result);
  assert(result.code == ErrorCode::WrongType);
  assert(!store.Exists(ctx, "a"));
  assert(*store.Get(ctx, "s") == "v");
}

void TestTypeTrackingWithinBatch() {
  MemoryStore store;
  auto        ctx = Context::Background();

  std::vector<std::int64_t> replies;
  // a set created earlier in the batch is replaced by SET, then ZADD on it fails
  auto result = store.ExecTransaction(ctx, {ZAdd("k", "m", 1), Set("k", "v"), ZAdd("k", "m", 2)}, replies);
  assert(result.code == ErrorCode::WrongType);
  assert(!store.Exists(ctx, "k"));

  Command del;
  del.op  = Command::Op::Del;
  del.key = "k";
  assert(store.ExecTransaction(ctx, {Set("k", "v"), del, ZAdd("k", "m", 2)}, replies));
  assert(store.ZCount(ctx, "k", ScoreRange{}) == 1);
}

void TestWrongTypeReads() {
  MemoryStore store;
  auto        ctx = Context::Background();

  std::vector<std::int64_t> replies;
  assert(store.ExecTransaction(ctx, {Set("s", "v"), ZAdd("z", "m", 1)}, replies));

  bool threw = false;
  try {
    (void)store.Get(ctx, "z");
  } catch (const StoreError& e) {
    threw = e.code() == ErrorCode::WrongType;
  }
  assert(threw);

  threw = false;
  try {
    (void)store.ZCount(ctx, "s", ScoreRange{});
  } catch (const StoreError& e) {
    threw = e.code() == ErrorCode::WrongType;
  }
  assert(threw);

  // MGET never fails on type
  auto values = store.MGet(ctx, {"s", "z", "none"});
  assert(values[0] && *values[0] == "v");
  assert(!values[1] && !values[2]);
}

void TestRangeOrderingTiesByMember() {
  MemoryStore store;
  auto        ctx = Context::Background();

  std::vector<std::int64_t> replies;
  assert(store.ExecTransaction(ctx, {ZAdd("z", "b", 5), ZAdd("z", "a", 5), ZAdd("z", "c", 1), ZAdd("z", "d", 9)}, replies));

  auto all = store.ZRangeByScore(ctx, "z", ScoreRange{}, 0, -1);
  assert((all == std::vector<std::string>{"c", "a", "b", "d"}));

  auto window = store.ZRangeByScore(ctx, "z", ScoreRange{5, 9}, 1, 2);
  assert((window == std::vector<std::string>{"b", "d"}));

  assert(store.ZRangeByScore(ctx, "z", ScoreRange{}, -1, 10).empty());
  assert(store.ZRangeByScore(ctx, "z", ScoreRange{}, 0, 0).empty());
  assert(store.ZCount(ctx, "z", ScoreRange{5, 5}) == 2);
  assert(store.ZCount(ctx, "z", ScoreRange{10, std::nullopt}) == 0);
}

void TestCancelledContextIsRejected() {
  MemoryStore store;
  Context     ctx;
  ctx.Cancel();

  std::vector<std::int64_t> replies;
  auto result = store.ExecTransaction(ctx, {Set("k", "v")}, replies);
  assert(result.code == ErrorCode::Cancelled);

  bool threw = false;
  try {
    (void)store.Get(ctx, "k");
  } catch (const StoreError& e) {
    threw = e.code() == ErrorCode::Cancelled;
  }
  assert(threw);
  assert(!store.Exists(Context::Background(), "k"));
}

void TestEvalShaSeesAtomicSnapshot() {
  MemoryStore store;
  auto        ctx = Context::Background();

  // counts members and values; a writer adds both in one transaction
  auto body = [](ScriptContext& s, const std::vector<std::string>& keys, const std::vector<std::string>&) {
    auto n       = s.ZCount(keys[0], ScoreRange{});
    auto members = s.ZRangeByScore(keys[0], ScoreRange{}, 0, -1);
    auto values  = s.MGet(members);
    std::int64_t present = 0;
    for (const auto& v : values) present += v ? 1 : 0;
    return Reply::Array({Reply::Integer(n), Reply::Integer(present)});
  };
  auto sha = store.ScriptLoad(ctx, Script{"snapshot", body});

  std::thread writer([&] {
    for (int i = 0; i < 500; ++i) {
      std::vector<std::int64_t> replies;
      auto                      key = "k" + std::to_string(i);
      assert(store.ExecTransaction(Context::Background(), {Set(key, "v"), ZAdd("idx", key, i)}, replies));
    }
  });

  for (int i = 0; i < 200; ++i) {
    auto reply = store.EvalSha(ctx, sha, {"idx"}, {});
    assert(reply.elements()[0].integer() == reply.elements()[1].integer());
  }
  writer.join();
}

void TestUnknownHandleIsNoScript() {
  MemoryStore store;

  bool threw = false;
  try {
    (void)store.EvalSha(Context::Background(), "0000000000000000", {}, {});
  } catch (const StoreError& e) {
    threw = e.code() == ErrorCode::NoScript;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTypeErrorLeavesKeyspaceUntouched();
  TestTypeTrackingWithinBatch();
  TestWrongTypeReads();
  TestRangeOrderingTiesByMember();
  TestCancelledContextIsRejected();
  TestEvalShaSeesAtomicSnapshot();
  TestUnknownHandleIsNoScript();

  std::cout << "tkv_unit_memory_store: pass\n";
  return 0;
}
