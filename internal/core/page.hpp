#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/store/api/reply.hpp"
#include "internal/store/api/result.hpp"
#include "internal/store/api/score.hpp"
#include "internal/util/time.hpp"

namespace tkv::core {

/*
  One element of a page sequence.

    Payload  value fetched for an index member
    Missing  index member with no primary value
    Failure  terminal error, last item of the sequence

  View() borrows from the buffer of the cursor that produced the item
  and is valid until that cursor advances. Copy() when it must outlive
  the step.
*/
class PageItem {
 public:
  enum class Kind { Payload, Missing, Failure };

  PageItem() = default;

  static PageItem Payload(std::string_view value);
  static PageItem Missing();
  static PageItem Failure(store::Result error);

  Kind kind() const {
    return kind_;
  }

  // false for the terminal error item
  bool ok() const {
    return kind_ != Kind::Failure;
  }
  bool present() const {
    return kind_ == Kind::Payload;
  }

  std::string_view View() const {
    return value_;
  }
  std::string Copy() const {
    return std::string(value_);
  }

  const store::Result& error() const {
    return error_;
  }

 private:
  Kind             kind_ = Kind::Missing;
  std::string_view value_;
  store::Result    error_;
};

/*
  Pull-based sequence of page items.

    while (cursor->Next()) use(cursor->Current());

  Stopping early is just not calling Next() again.
*/
class RecordCursor {
 public:
  virtual ~RecordCursor() = default;

  virtual bool            Next()          = 0;
  virtual const PageItem& Current() const = 0;
};

std::unique_ptr<RecordCursor> MakeEmptyCursor();

// Yields the MGET values in order, Missing for nil.
std::unique_ptr<RecordCursor> MakeValuesCursor(std::shared_ptr<const std::vector<std::optional<std::string>>> values);

// Yields the elements of reply.elements()[index], which must hold only strings and nils.
std::unique_ptr<RecordCursor> MakeReplyCursor(std::shared_ptr<const store::Reply> reply, std::size_t index);

struct Page {
  std::unique_ptr<RecordCursor> cursor;
  std::int64_t                  total = 0;
};

// Inclusive lastModified window. Unset bound is open.
struct TimeRange {
  std::optional<util::TimePoint> from;
  std::optional<util::TimePoint> to;

  store::ScoreRange ToScoreRange() const;
};

} // namespace tkv::core
