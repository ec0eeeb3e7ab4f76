#include "internal/core/timestamped_kv.hpp"

#include <stdexcept>

#include "internal/core/range_script.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/api/pipeline.hpp"
#include "internal/util/errors.hpp"

namespace tkv::core {

namespace {

using observability::BoolField;
using observability::IntField;
using observability::KeyField;

[[noreturn]] void ThrowWrapped(const util::StoreError& e, const char* step) {
  throw util::StoreError(e.ToResult().Wrap(step));
}

void ThrowIfFailed(const store::Result& result, const char* step) {
  if (!result) throw util::StoreError(result.Wrap(step));
}

void CheckWindow(std::int64_t offset, std::int64_t limit) {
  if (offset < 0) throw std::invalid_argument("offset must not be negative");
  if (limit < 0) throw std::invalid_argument("limit must not be negative");
}

// [integer, [string|nil, ...]]
void CheckRangeReply(const store::Reply& reply) {
  if (!reply.IsArray() || reply.elements().size() != 2) {
    throw util::UnexpectedScriptResult(std::string("unexpected result from range script: got ") +
                                       store::ReplyTypeName(reply.type()));
  }

  const auto& total  = reply.elements()[0];
  const auto& values = reply.elements()[1];
  if (!total.IsInteger() || !values.IsArray()) {
    throw util::UnexpectedScriptResult(std::string("unexpected result from range script: [") +
                                       store::ReplyTypeName(total.type()) + ", " + store::ReplyTypeName(values.type()) +
                                       "]");
  }

  for (const auto& v : values.elements()) {
    if (!v.IsString() && !v.IsNil()) {
      throw util::UnexpectedScriptResult(std::string("unexpected value in range script result: ") +
                                         store::ReplyTypeName(v.type()));
    }
  }
}

} // namespace

TimestampedKv::TimestampedKv(std::shared_ptr<store::Store> store, keys::KeyComposer keys,
                             std::int64_t max_consistent_page_size)
    : store_(std::move(store)),
      keys_(std::move(keys)),
      index_key_(keys_.IndexKey()),
      max_consistent_page_size_(max_consistent_page_size),
      range_script_(*store_, RangeScript()) {
}

std::optional<std::string> TimestampedKv::Get(const util::Context& ctx, const Id& id) {
  try {
    return store_->Get(ctx, keys_.Compose(id));
  } catch (const util::StoreError& e) {
    ThrowWrapped(e, "failed to get entity");
  }
}

bool TimestampedKv::Set(const util::Context& ctx, const std::string& data, util::TimePoint last_modified, const Id& id) {
  auto key   = keys_.Compose(id);
  auto score = util::ToUnixNanos(last_modified);

  store::TxPipeline pipe(*store_);
  pipe.Set(key, data);
  const auto added = pipe.ZAdd(index_key_, key, score);
  ThrowIfFailed(pipe.Exec(ctx), "failed to set entity");

  const bool existed = pipe.Reply(added) == 0;
  TKV_LOG_DEBUG("set", {KeyField("key", key), IntField("score", score), BoolField("existed", existed)});
  return existed;
}

void TimestampedKv::BulkSet(const util::Context& ctx, const std::vector<BulkSetRecord>& records) {
  if (records.empty()) return;

  store::TxPipeline pipe(*store_);
  for (const auto& r : records) {
    auto key = keys_.Compose(r.id);
    pipe.Set(key, r.data);
    pipe.ZAdd(index_key_, std::move(key), util::ToUnixNanos(r.last_modified));
  }
  ThrowIfFailed(pipe.Exec(ctx), "failed to bulk insert records");

  TKV_LOG_DEBUG("bulk set", {IntField("records", static_cast<std::int64_t>(records.size()))});
}

void TimestampedKv::Delete(const util::Context& ctx, const Id& id) {
  auto key = keys_.Compose(id);

  store::TxPipeline pipe(*store_);
  const auto removed = pipe.Del(key);
  pipe.ZRem(index_key_, key);
  ThrowIfFailed(pipe.Exec(ctx), "failed to delete entity");

  TKV_LOG_DEBUG("delete", {KeyField("key", key), BoolField("existed", pipe.Reply(removed) > 0)});
}

bool TimestampedKv::Exists(const util::Context& ctx, const Id& id) {
  try {
    return store_->Exists(ctx, keys_.Compose(id));
  } catch (const util::StoreError& e) {
    ThrowWrapped(e, "failed to check if entity exists");
  }
}

Page TimestampedKv::FetchPage(const util::Context& ctx, const TimeRange& window, std::int64_t offset,
                              std::int64_t limit) {
  CheckWindow(offset, limit);
  const auto range = window.ToScoreRange();

  Page page;
  try {
    page.total = store_->ZCount(ctx, index_key_, range);
  } catch (const util::StoreError& e) {
    ThrowWrapped(e, "failed to count");
  }

  std::vector<std::string> members;
  try {
    members = store_->ZRangeByScore(ctx, index_key_, range, offset, limit);
  } catch (const util::StoreError& e) {
    ThrowWrapped(e, "failed to execute zrangebyscore");
  }

  TKV_LOG_DEBUG("fetch page", {IntField("offset", offset), IntField("limit", limit), IntField("total", page.total),
                               IntField("selected", static_cast<std::int64_t>(members.size()))});

  if (members.empty()) {
    page.cursor = MakeEmptyCursor();
    return page;
  }

  try {
    auto values = std::make_shared<const std::vector<std::optional<std::string>>>(store_->MGet(ctx, members));
    page.cursor = MakeValuesCursor(std::move(values));
  } catch (const util::StoreError& e) {
    ThrowWrapped(e, "failed to execute mget");
  }
  return page;
}

Page TimestampedKv::FetchPageConsistent(const util::Context& ctx, const TimeRange& window, std::int64_t offset,
                                        std::int64_t limit) {
  CheckWindow(offset, limit);
  if (limit > max_consistent_page_size_) {
    TKV_LOG_WARN("consistent page above recommended size, prefer smaller pages",
                 {IntField("limit", limit), IntField("max_consistent_page_size", max_consistent_page_size_)});
  }

  const auto                     range = window.ToScoreRange();
  const std::vector<std::string> keys{index_key_};
  const std::vector<std::string> args{store::FormatMin(range), store::FormatMax(range), std::to_string(offset),
                                      std::to_string(limit)};

  std::string sha;
  try {
    sha = range_script_.Get(ctx);
  } catch (const util::StoreError& e) {
    ThrowWrapped(e, "failed to load script");
  }

  store::Reply reply;
  for (int attempt = 0;; ++attempt) {
    try {
      reply = store_->EvalSha(ctx, sha, keys, args);
      break;
    } catch (const util::StoreError& e) {
      if (e.code() != store::ErrorCode::NoScript || attempt > 0) {
        ThrowWrapped(e, "failed to execute range script");
      }
    }

    try {
      sha = range_script_.Reload(ctx, sha);
    } catch (const util::StoreError& e) {
      ThrowWrapped(e, "failed to load script");
    }
  }

  CheckRangeReply(reply);

  Page page;
  page.total  = reply.elements()[0].integer();
  page.cursor = MakeReplyCursor(std::make_shared<const store::Reply>(std::move(reply)), 1);

  TKV_LOG_DEBUG("fetch page consistent", {IntField("offset", offset), IntField("limit", limit), IntField("total", page.total)});
  return page;
}

PageFunc TimestampedKv::PageFn() {
  return [this](const util::Context& ctx, const TimeRange& range, std::int64_t offset, std::int64_t limit) {
    return FetchPage(ctx, range, offset, limit);
  };
}

PageFunc TimestampedKv::ConsistentPageFn() {
  return [this](const util::Context& ctx, const TimeRange& range, std::int64_t offset, std::int64_t limit) {
    return FetchPageConsistent(ctx, range, offset, limit);
  };
}

} // namespace tkv::core
