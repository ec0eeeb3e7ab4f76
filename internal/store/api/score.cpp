#include "score.hpp"

#include <charconv>

#include "internal/util/errors.hpp"

namespace tkv::store {

namespace {

constexpr const char* kNegInf = "-inf";
constexpr const char* kPosInf = "+inf";

std::int64_t ParseInteger(const std::string& s) {
  std::int64_t value = 0;
  const auto* begin  = s.data();
  const auto* end    = s.data() + s.size();
  auto [ptr, ec]     = std::from_chars(begin, end, value);
  if (s.empty() || ec != std::errc() || ptr != end) {
    throw util::StoreError(ErrorCode::InvalidArgument, "min or max is not an integer score: '" + s + "'");
  }
  return value;
}

} // namespace

std::string FormatMin(const ScoreRange& range) {
  return range.min ? std::to_string(*range.min) : kNegInf;
}

std::string FormatMax(const ScoreRange& range) {
  return range.max ? std::to_string(*range.max) : kPosInf;
}

ScoreRange ParseScoreRange(const std::string& min, const std::string& max) {
  ScoreRange range;

  if (min == kPosInf || max == kNegInf) {
    // valid bounds that can never match; encode as an inverted interval
    range.min = 1;
    range.max = 0;
    return range;
  }

  if (min != kNegInf) range.min = ParseInteger(min);
  if (max != kPosInf) range.max = ParseInteger(max);
  return range;
}

} // namespace tkv::store
