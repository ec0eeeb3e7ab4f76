#include "memory_store.hpp"

#include <iterator>
#include <limits>
#include <mutex>

#include "internal/util/errors.hpp"

namespace tkv::store::memory {

namespace {

constexpr const char* kWrongType = "WRONGTYPE Operation against a key holding the wrong kind of value";

[[noreturn]] void ThrowWrongType() {
  throw util::StoreError(ErrorCode::WrongType, kWrongType);
}

} // namespace

// ------------------------------------------------------------------
// Sorted set
// ------------------------------------------------------------------

bool MemoryStore::SortedSet::Add(const std::string& member, std::int64_t score) {
  auto it = scores.find(member);
  if (it == scores.end()) {
    scores.emplace(member, score);
    ordered.emplace(score, member);
    return true;
  }

  if (it->second != score) {
    ordered.erase({it->second, member});
    ordered.emplace(score, member);
    it->second = score;
  }
  return false;
}

bool MemoryStore::SortedSet::Remove(const std::string& member) {
  auto it = scores.find(member);
  if (it == scores.end()) return false;

  ordered.erase({it->second, member});
  scores.erase(it);
  return true;
}

std::int64_t MemoryStore::SortedSet::Count(const ScoreRange& range) const {
  if (range.IsEmpty()) return 0;

  auto begin = range.min ? ordered.lower_bound({*range.min, std::string()}) : ordered.begin();
  auto end   = ordered.end();
  if (range.max && *range.max != std::numeric_limits<std::int64_t>::max()) {
    end = ordered.lower_bound({*range.max + 1, std::string()});
  }
  if (begin == ordered.end()) return 0;
  return static_cast<std::int64_t>(std::distance(begin, end));
}

std::vector<std::string> MemoryStore::SortedSet::Range(const ScoreRange& range, std::int64_t offset,
                                                       std::int64_t count) const {
  std::vector<std::string> out;
  if (range.IsEmpty() || offset < 0 || count == 0) return out;

  auto it = range.min ? ordered.lower_bound({*range.min, std::string()}) : ordered.begin();
  for (std::int64_t skipped = 0; it != ordered.end() && skipped < offset; ++it) {
    if (!range.Contains(it->first)) return out;
    ++skipped;
  }

  for (; it != ordered.end(); ++it) {
    if (!range.Contains(it->first)) break;
    if (count >= 0 && static_cast<std::int64_t>(out.size()) >= count) break;
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Script evaluation
// ------------------------------------------------------------------

class MemoryStore::Evaluation final : public ScriptContext {
 public:
  explicit Evaluation(const State& state) : state_(state) {
  }

  std::int64_t ZCount(const std::string& set, const ScoreRange& range) override {
    const auto* z = FindSet(state_, set);
    return z ? z->Count(range) : 0;
  }

  std::vector<std::string> ZRangeByScore(const std::string& set, const ScoreRange& range, std::int64_t offset,
                                         std::int64_t count) override {
    const auto* z = FindSet(state_, set);
    return z ? z->Range(range, offset, count) : std::vector<std::string>{};
  }

  std::vector<std::optional<std::string>> MGet(const std::vector<std::string>& keys) override {
    return MGetLocked(state_, keys);
  }

 private:
  const State& state_;
};

// ------------------------------------------------------------------
// Store
// ------------------------------------------------------------------

MemoryStore::MemoryStore() = default;

const MemoryStore::SortedSet* MemoryStore::FindSet(const State& s, const std::string& key) {
  auto it = s.zsets.find(key);
  if (it != s.zsets.end()) return &it->second;
  if (s.strings.contains(key)) ThrowWrongType();
  return nullptr;
}

std::optional<std::string> MemoryStore::GetLocked(const State& s, const std::string& key) {
  auto it = s.strings.find(key);
  if (it != s.strings.end()) return it->second;
  if (s.zsets.contains(key)) ThrowWrongType();
  return std::nullopt;
}

std::vector<std::optional<std::string>> MemoryStore::MGetLocked(const State& s, const std::vector<std::string>& keys) {
  std::vector<std::optional<std::string>> out;
  out.reserve(keys.size());
  for (const auto& key : keys) {
    // non-string keys read as nil, like MGET
    auto it = s.strings.find(key);
    out.push_back(it == s.strings.end() ? std::nullopt : std::optional<std::string>(it->second));
  }
  return out;
}

std::optional<std::string> MemoryStore::Get(const util::Context& ctx, const std::string& key) {
  ctx.ThrowIfDone();
  std::shared_lock lock(mutex_);
  return GetLocked(state_, key);
}

bool MemoryStore::Exists(const util::Context& ctx, const std::string& key) {
  ctx.ThrowIfDone();
  std::shared_lock lock(mutex_);
  return state_.strings.contains(key) || state_.zsets.contains(key);
}

std::vector<std::optional<std::string>> MemoryStore::MGet(const util::Context& ctx, const std::vector<std::string>& keys) {
  ctx.ThrowIfDone();
  std::shared_lock lock(mutex_);
  return MGetLocked(state_, keys);
}

std::int64_t MemoryStore::ZCount(const util::Context& ctx, const std::string& set, const ScoreRange& range) {
  ctx.ThrowIfDone();
  std::shared_lock lock(mutex_);
  const auto*      z = FindSet(state_, set);
  return z ? z->Count(range) : 0;
}

std::vector<std::string> MemoryStore::ZRangeByScore(const util::Context& ctx, const std::string& set, const ScoreRange& range,
                                                    std::int64_t offset, std::int64_t count) {
  ctx.ThrowIfDone();
  std::shared_lock lock(mutex_);
  const auto*      z = FindSet(state_, set);
  return z ? z->Range(range, offset, count) : std::vector<std::string>{};
}

Result MemoryStore::Validate(const State& s, const std::vector<Command>& commands) {
  enum class Kind { None, String, ZSet };

  // key kinds as they evolve through the batch
  std::unordered_map<std::string, Kind> kinds;
  auto kind_of = [&](const std::string& key) {
    if (auto it = kinds.find(key); it != kinds.end()) return it->second;
    if (s.strings.contains(key)) return Kind::String;
    if (s.zsets.contains(key)) return Kind::ZSet;
    return Kind::None;
  };

  for (const auto& c : commands) {
    switch (c.op) {
      case Command::Op::Set:
        kinds[c.key] = Kind::String;
        break;
      case Command::Op::Del:
        kinds[c.key] = Kind::None;
        break;
      case Command::Op::ZAdd:
        if (kind_of(c.key) == Kind::String) return Result::Err(ErrorCode::WrongType, kWrongType);
        kinds[c.key] = Kind::ZSet;
        break;
      case Command::Op::ZRem:
        if (kind_of(c.key) == Kind::String) return Result::Err(ErrorCode::WrongType, kWrongType);
        break;
    }
  }
  return Result::Ok();
}

std::int64_t MemoryStore::Apply(State& s, const Command& c) {
  switch (c.op) {
    case Command::Op::Set:
      s.zsets.erase(c.key);
      s.strings[c.key] = c.value;
      return 1;

    case Command::Op::Del:
      return static_cast<std::int64_t>(s.strings.erase(c.key) + s.zsets.erase(c.key));

    case Command::Op::ZAdd:
      return s.zsets[c.key].Add(c.member, c.score) ? 1 : 0;

    case Command::Op::ZRem: {
      auto it = s.zsets.find(c.key);
      if (it == s.zsets.end()) return 0;
      const bool removed = it->second.Remove(c.member);
      if (it->second.scores.empty()) s.zsets.erase(it);
      return removed ? 1 : 0;
    }
  }
  return 0;
}

Result MemoryStore::ExecTransaction(const util::Context& ctx, const std::vector<Command>& commands,
                                    std::vector<std::int64_t>& replies) {
  if (auto err = ctx.Err(); !err) return err;

  std::unique_lock lock(mutex_);

  if (auto valid = Validate(state_, commands); !valid) return valid;

  replies.clear();
  replies.reserve(commands.size());
  for (const auto& c : commands) {
    replies.push_back(Apply(state_, c));
  }
  return Result::Ok();
}

std::string MemoryStore::ScriptLoad(const util::Context& ctx, const Script& script) {
  ctx.ThrowIfDone();
  return scripts_.Load(script);
}

Reply MemoryStore::EvalSha(const util::Context& ctx, const std::string& sha, const std::vector<std::string>& keys,
                           const std::vector<std::string>& args) {
  ctx.ThrowIfDone();

  auto body = scripts_.Find(sha);
  if (!body) throw util::StoreError(ErrorCode::NoScript, "NOSCRIPT No matching script");

  std::shared_lock lock(mutex_);
  Evaluation       eval(state_);
  return (*body)(eval, keys, args);
}

void MemoryStore::ScriptFlush() {
  scripts_.Flush();
}

} // namespace tkv::store::memory
