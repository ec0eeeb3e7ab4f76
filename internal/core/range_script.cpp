#include "internal/core/range_script.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace tkv::core {

namespace {

std::int64_t ParseInt(const std::string& s, const char* what) {
  std::int64_t value = 0;
  auto [ptr, ec]     = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    throw util::StoreError(store::ErrorCode::InvalidArgument, std::string("range script: ") + what + " is not an integer");
  }
  return value;
}

store::Reply EvalRange(store::ScriptContext& store, const std::vector<std::string>& keys,
                       const std::vector<std::string>& args) {
  if (keys.size() != 1 || args.size() != 4) {
    throw util::StoreError(store::ErrorCode::InvalidArgument, "range script: expects 1 key and 4 arguments");
  }

  const auto& index  = keys[0];
  const auto  range  = store::ParseScoreRange(args[0], args[1]);
  const auto  offset = ParseInt(args[2], "offset");
  const auto  count  = ParseInt(args[3], "count");

  const auto total = store.ZCount(index, range);
  if (total == 0) {
    return store::Reply::Array({store::Reply::Integer(0), store::Reply::Array({})});
  }

  auto members = store.ZRangeByScore(index, range, offset, count);
  if (members.empty()) {
    return store::Reply::Array({store::Reply::Integer(total), store::Reply::Array({})});
  }

  return store::Reply::Array({store::Reply::Integer(total), store::Reply::FromValues(store.MGet(members))});
}

} // namespace

store::Script RangeScript() {
  return store::Script{kRangeScriptName, &EvalRange};
}

} // namespace tkv::core
