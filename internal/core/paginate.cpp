#include "internal/core/paginate.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tkv::core {

namespace {

constexpr const char* kFirstPageFailed = "fetching first page failed";
constexpr const char* kNextPageFailed  = "fetching next page failed";

class PaginatingCursor final : public RecordCursor {
 public:
  PaginatingCursor(util::Context ctx, PageFunc fetch, TimeRange range, std::int64_t offset, std::int64_t limit,
                   Page first)
      : ctx_(std::move(ctx)),
        fetch_(std::move(fetch)),
        range_(range),
        offset_(offset),
        limit_(limit),
        total_(first.total),
        page_(std::move(first.cursor)) {
  }

  bool Next() override {
    if (done_) return false;

    for (;;) {
      if (page_->Next()) {
        if (!page_->Current().ok()) done_ = true;
        return true;
      }

      offset_ += limit_;
      if (offset_ >= total_) {
        done_ = true;
        return false;
      }

      if (auto failure = FetchNext(); !failure) {
        failure_ = PageItem::Failure(failure);
        failed_  = true;
        done_    = true;
        return true;
      }
    }
  }

  const PageItem& Current() const override {
    return failed_ ? failure_ : page_->Current();
  }

 private:
  store::Result FetchNext() {
    TKV_LOG_DEBUG("paginate fetch", {observability::IntField("offset", offset_), observability::IntField("limit", limit_)});
    try {
      auto next = fetch_(ctx_, range_, offset_, limit_);
      page_     = next.cursor ? std::move(next.cursor) : MakeEmptyCursor();
      total_    = next.total;
      return store::Result::Ok();
    } catch (const util::StoreError& e) {
      return e.ToResult().Wrap(kNextPageFailed);
    } catch (const std::exception& e) {
      return store::Result::Err(store::ErrorCode::InternalError, e.what()).Wrap(kNextPageFailed);
    }
  }

  util::Context                 ctx_;
  PageFunc                      fetch_;
  TimeRange                     range_;
  std::int64_t                  offset_;
  std::int64_t                  limit_;
  std::int64_t                  total_;
  std::unique_ptr<RecordCursor> page_;
  PageItem                      failure_;
  bool                          failed_ = false;
  bool                          done_   = false;
};

} // namespace

std::unique_ptr<RecordCursor> Paginate(const util::Context& ctx, PageFunc fetch, const TimeRange& range,
                                       std::int64_t offset, std::int64_t limit) {
  if (limit <= 0) throw std::invalid_argument("paginate: limit must be positive");
  if (offset < 0) throw std::invalid_argument("paginate: offset must not be negative");

  Page first;
  try {
    first = fetch(ctx, range, offset, limit);
  } catch (const util::StoreError& e) {
    throw util::StoreError(e.ToResult().Wrap(kFirstPageFailed));
  }
  if (!first.cursor) first.cursor = MakeEmptyCursor();

  if (first.total <= limit) {
    return std::move(first.cursor);
  }
  return std::make_unique<PaginatingCursor>(ctx, std::move(fetch), range, offset, limit, std::move(first));
}

} // namespace tkv::core
