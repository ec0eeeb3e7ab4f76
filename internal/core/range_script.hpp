#pragma once

#include "internal/store/api/script.hpp"

namespace tkv::core {

inline constexpr const char* kRangeScriptName = "tkv.range.v1";

/*
  Range procedure, evaluated by the store in one indivisible step.

    KEYS[1]  index key
    ARGV     min, max ("-inf" / "+inf" / integer), offset, count

  Reply:
    total == 0        -> [0, []]
    empty selection   -> [total, []]
    otherwise         -> [total, MGET(selection)]   nil for missing values
*/
store::Script RangeScript();

} // namespace tkv::core
