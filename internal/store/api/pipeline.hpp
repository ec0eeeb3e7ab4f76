#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/store/api/store.hpp"

namespace tkv::store {

/*
  Queues writes and submits them as one atomic unit.

    TxPipeline pipe(store);
    pipe.Set(key, value);
    auto added = pipe.ZAdd(index, key, ts);
    if (auto r = pipe.Exec(ctx); !r) ...
    pipe.Reply(added);

  Each queueing call returns the index of its reply.
*/
class TxPipeline {
 public:
  explicit TxPipeline(Store& store) : store_(store) {
  }

  std::size_t Set(std::string key, std::string value);
  std::size_t Del(std::string key);
  std::size_t ZAdd(std::string set, std::string member, std::int64_t score);
  std::size_t ZRem(std::string set, std::string member);

  std::size_t Size() const {
    return commands_.size();
  }

  Result Exec(const util::Context& ctx);

  // Valid only after a successful Exec().
  std::int64_t Reply(std::size_t index) const;

 private:
  std::size_t Push(Command command);

  Store&                    store_;
  std::vector<Command>      commands_;
  std::vector<std::int64_t> replies_;
  bool                      executed_ = false;
};

} // namespace tkv::store
