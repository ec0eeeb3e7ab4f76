#include "internal/core/page.hpp"

namespace tkv::core {

PageItem PageItem::Payload(std::string_view value) {
  PageItem item;
  item.kind_  = Kind::Payload;
  item.value_ = value;
  return item;
}

PageItem PageItem::Missing() {
  return PageItem();
}

PageItem PageItem::Failure(store::Result error) {
  PageItem item;
  item.kind_  = Kind::Failure;
  item.error_ = std::move(error);
  return item;
}

namespace {

class EmptyCursor final : public RecordCursor {
 public:
  bool Next() override {
    return false;
  }
  const PageItem& Current() const override {
    return current_;
  }

 private:
  PageItem current_;
};

class ValuesCursor final : public RecordCursor {
 public:
  explicit ValuesCursor(std::shared_ptr<const std::vector<std::optional<std::string>>> values)
      : values_(std::move(values)) {
  }

  bool Next() override {
    if (pos_ >= values_->size()) return false;
    const auto& v = (*values_)[pos_++];
    current_      = v ? PageItem::Payload(*v) : PageItem::Missing();
    return true;
  }

  const PageItem& Current() const override {
    return current_;
  }

 private:
  std::shared_ptr<const std::vector<std::optional<std::string>>> values_;
  std::size_t                                                    pos_ = 0;
  PageItem                                                       current_;
};

class ReplyCursor final : public RecordCursor {
 public:
  ReplyCursor(std::shared_ptr<const store::Reply> reply, std::size_t index)
      : reply_(std::move(reply)), elements_(reply_->elements()[index].elements()) {
  }

  bool Next() override {
    if (pos_ >= elements_.size()) return false;
    const auto& e = elements_[pos_++];
    current_      = e.IsString() ? PageItem::Payload(e.str()) : PageItem::Missing();
    return true;
  }

  const PageItem& Current() const override {
    return current_;
  }

 private:
  std::shared_ptr<const store::Reply> reply_;
  const std::vector<store::Reply>&    elements_;
  std::size_t                         pos_ = 0;
  PageItem                            current_;
};

} // namespace

std::unique_ptr<RecordCursor> MakeEmptyCursor() {
  return std::make_unique<EmptyCursor>();
}

std::unique_ptr<RecordCursor> MakeValuesCursor(std::shared_ptr<const std::vector<std::optional<std::string>>> values) {
  return std::make_unique<ValuesCursor>(std::move(values));
}

std::unique_ptr<RecordCursor> MakeReplyCursor(std::shared_ptr<const store::Reply> reply, std::size_t index) {
  return std::make_unique<ReplyCursor>(std::move(reply), index);
}

store::ScoreRange TimeRange::ToScoreRange() const {
  store::ScoreRange range;
  if (from) range.min = util::ToUnixNanos(*from);
  if (to) range.max = util::ToUnixNanos(*to);
  return range;
}

} // namespace tkv::core
