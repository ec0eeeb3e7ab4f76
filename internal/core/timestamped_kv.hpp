#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/page.hpp"
#include "internal/core/paginate.hpp"
#include "internal/core/script_handle.hpp"
#include "internal/keys/key_composer.hpp"
#include "internal/store/api/store.hpp"
#include "internal/util/time.hpp"

namespace tkv::core {

// Identifier segments, joined by the key composer.
using Id = std::vector<std::string>;

struct BulkSetRecord {
  util::TimePoint last_modified;
  Id              id;
  std::string     data;
};

/*
  Key/value records with a lastModified ordering index.

  Every record lives at Compose(id) and has exactly one member in the
  sorted set at IndexKey(), scored with lastModified in Unix nanoseconds.

  Writes (Set, BulkSet, Delete) touch both in one store transaction.

  Range reads:
    FetchPage            ZCOUNT, ZRANGEBYSCORE, MGET as separate calls.
                         Concurrent writers can make total and items
                         disagree. Cheap, not linearizable.
    FetchPageConsistent  one scripted evaluation, total and items come
                         from the same snapshot.

  All failures are thrown as util::StoreError prefixed with the step.
  Payload views in a Page stay valid until the cursor advances.
  PageFn() and ConsistentPageFn() capture this instance, so a Paginate
  cursor built from them must not outlive it.
*/
class TimestampedKv {
 public:
  static constexpr std::int64_t kDefaultMaxConsistentPageSize = 5000;

  TimestampedKv(std::shared_ptr<store::Store> store, keys::KeyComposer keys,
                std::int64_t max_consistent_page_size = kDefaultMaxConsistentPageSize);

  // nullopt when absent
  std::optional<std::string> Get(const util::Context& ctx, const Id& id);

  // Returns true when the record existed before.
  bool Set(const util::Context& ctx, const std::string& data, util::TimePoint last_modified, const Id& id);

  void BulkSet(const util::Context& ctx, const std::vector<BulkSetRecord>& records);
  void Delete(const util::Context& ctx, const Id& id);
  bool Exists(const util::Context& ctx, const Id& id);

  Page FetchPage(const util::Context& ctx, const TimeRange& range, std::int64_t offset, std::int64_t limit);
  Page FetchPageConsistent(const util::Context& ctx, const TimeRange& range, std::int64_t offset, std::int64_t limit);

  // Page functions for Paginate, bound to this instance (see above).
  PageFunc PageFn();
  PageFunc ConsistentPageFn();

  const keys::KeyComposer& Keys() const {
    return keys_;
  }
  store::Store& Backend() const {
    return *store_;
  }

 private:
  std::shared_ptr<store::Store> store_;
  keys::KeyComposer             keys_;
  std::string                   index_key_;
  std::int64_t                  max_consistent_page_size_;
  ScriptHandle                  range_script_;
};

} // namespace tkv::core
