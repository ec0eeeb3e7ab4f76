#include "internal/core/script_handle.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/range_script.hpp"
#include "tests/unit/forwarding_store.hpp"

namespace {

using tkv::core::RangeScript;
using tkv::core::ScriptHandle;
using tkv::testing::ForwardingStore;
using tkv::util::Context;
using tkv::util::StoreError;

void TestLoadsOnceAndCaches() {
  ForwardingStore store;
  ScriptHandle    handle(store, RangeScript());
  auto            ctx = Context::Background();

  auto first  = handle.Get(ctx);
  auto second = handle.Get(ctx);
  assert(first == second);
  assert(first == tkv::store::ScriptDigest(tkv::core::kRangeScriptName));
  assert(store.loads == 1);
}

void TestFailedLoadDoesNotPoison() {
  ForwardingStore store;
  store.fail_loads = 1;
  ScriptHandle handle(store, RangeScript());
  auto         ctx = Context::Background();

  bool threw = false;
  try {
    (void)handle.Get(ctx);
  } catch (const StoreError&) {
    threw = true;
  }
  assert(threw);

  auto sha = handle.Get(ctx);
  assert(!sha.empty());
  assert(store.loads == 2);
}

void TestConcurrentCallersConverge() {
  ForwardingStore store;
  ScriptHandle    handle(store, RangeScript());

  constexpr int            kThreads = 8;
  std::vector<std::string> seen(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] { seen[i] = handle.Get(Context::Background()); });
  }
  for (auto& t : threads) t.join();

  std::set<std::string> distinct(seen.begin(), seen.end());
  assert(distinct.size() == 1);
  assert(store.loads == 1);
}

void TestReloadReplacesStaleHandleOnce() {
  ForwardingStore store;
  ScriptHandle    handle(store, RangeScript());
  auto            ctx = Context::Background();

  auto sha = handle.Get(ctx);

  auto reloaded = handle.Reload(ctx, sha);
  assert(reloaded == sha);
  assert(store.loads == 2);

  // a caller holding an older handle does not trigger another load
  auto again = handle.Reload(ctx, "stale");
  assert(again == sha);
  assert(store.loads == 2);
}

void TestInvalidateForcesLoad() {
  ForwardingStore store;
  ScriptHandle    handle(store, RangeScript());
  auto            ctx = Context::Background();

  (void)handle.Get(ctx);
  handle.Invalidate();
  (void)handle.Get(ctx);
  assert(store.loads == 2);
}

} // namespace

int main() {
  TestLoadsOnceAndCaches();
  TestFailedLoadDoesNotPoison();
  TestConcurrentCallersConverge();
  TestReloadReplacesStaleHandleOnce();
  TestInvalidateForcesLoad();

  std::cout << "tkv_unit_script_handle: pass\n";
  return 0;
}
