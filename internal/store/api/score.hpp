#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tkv::store {

/*
  Inclusive score interval for sorted-set range commands.

  An unset bound is open: min defaults to -inf, max to +inf.
  Wire form of a bound is "-inf", "+inf" or a decimal integer.
*/
struct ScoreRange {
  std::optional<std::int64_t> min;
  std::optional<std::int64_t> max;

  bool Contains(std::int64_t score) const {
    return (!min || score >= *min) && (!max || score <= *max);
  }

  // min > max: nothing can match.
  bool IsEmpty() const {
    return min && max && *min > *max;
  }
};

std::string FormatMin(const ScoreRange& range);
std::string FormatMax(const ScoreRange& range);

// Throws StoreError(InvalidArgument) on malformed bounds.
ScoreRange ParseScoreRange(const std::string& min, const std::string& max);

} // namespace tkv::store
