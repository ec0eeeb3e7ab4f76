#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/paginate.hpp"
#include "internal/core/timestamped_kv.hpp"
#include "internal/keys/key_composer.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

int main() {
  using namespace std::chrono_literals;

  auto store = std::make_shared<tkv::store::memory::MemoryStore>();
  tkv::core::TimestampedKv kv(store, tkv::keys::KeyComposer(std::string(tkv::keys::kDelimPipe), "orders"));

  auto ctx  = tkv::util::Context::WithTimeout(5s);
  auto base = tkv::util::FromUnixNanos(1'700'000'000'000'000'000);

  // Ten orders, one second apart, written in one transaction.
  std::vector<tkv::core::BulkSetRecord> records;
  for (int i = 0; i < 10; ++i) {
    records.push_back({base + std::chrono::seconds(i), {"customer-1", "order-" + std::to_string(i)}, "order body " + std::to_string(i)});
  }

  try {
    kv.BulkSet(ctx, records);

    // Orders from seconds 2..7, three per page, each page a consistent snapshot.
    tkv::core::TimeRange window{base + 2s, base + 7s};
    auto cursor = tkv::core::Paginate(ctx, kv.ConsistentPageFn(), window, 0, 3);

    while (cursor->Next()) {
      const auto& item = cursor->Current();
      if (!item.ok()) {
        std::cerr << "paging failed: " << item.error().message << '\n';
        return 1;
      }
      std::cout << (item.present() ? item.Copy() : std::string("<missing>")) << '\n';
    }
  } catch (const tkv::util::StoreError& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }
  return 0;
}
