#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "internal/core/page.hpp"
#include "internal/util/context.hpp"

namespace tkv::core {

// One page of a range: FetchPage or FetchPageConsistent bound to a store.
using PageFunc = std::function<Page(const util::Context& ctx, const TimeRange& range, std::int64_t offset, std::int64_t limit)>;

/*
  Stitches repeated page fetches into one sequence.

  - first fetch failure throws StoreError("fetching first page failed: ...")
  - total <= limit: the first page cursor is returned as is
  - otherwise pages are fetched lazily, offset += limit, until
    offset >= total (total as reported by the latest page)
  - a later fetch failure becomes one Failure item
    ("fetching next page failed: ...") and ends the sequence

  limit must be positive, offset non-negative (std::invalid_argument).
*/
std::unique_ptr<RecordCursor> Paginate(const util::Context& ctx, PageFunc fetch, const TimeRange& range,
                                       std::int64_t offset, std::int64_t limit);

} // namespace tkv::core
