#include "pipeline.hpp"

#include <stdexcept>

namespace tkv::store {

std::size_t TxPipeline::Push(Command command) {
  if (executed_) throw std::logic_error("pipeline already executed");
  commands_.push_back(std::move(command));
  return commands_.size() - 1;
}

std::size_t TxPipeline::Set(std::string key, std::string value) {
  Command c;
  c.op    = Command::Op::Set;
  c.key   = std::move(key);
  c.value = std::move(value);
  return Push(std::move(c));
}

std::size_t TxPipeline::Del(std::string key) {
  Command c;
  c.op  = Command::Op::Del;
  c.key = std::move(key);
  return Push(std::move(c));
}

std::size_t TxPipeline::ZAdd(std::string set, std::string member, std::int64_t score) {
  Command c;
  c.op     = Command::Op::ZAdd;
  c.key    = std::move(set);
  c.member = std::move(member);
  c.score  = score;
  return Push(std::move(c));
}

std::size_t TxPipeline::ZRem(std::string set, std::string member) {
  Command c;
  c.op     = Command::Op::ZRem;
  c.key    = std::move(set);
  c.member = std::move(member);
  return Push(std::move(c));
}

Result TxPipeline::Exec(const util::Context& ctx) {
  if (executed_) return Result::Err(ErrorCode::InternalError, "pipeline already executed");
  executed_ = true;

  if (commands_.empty()) return Result::Ok();

  auto result = store_.ExecTransaction(ctx, commands_, replies_);
  if (!result) replies_.clear();
  return result;
}

std::int64_t TxPipeline::Reply(std::size_t index) const {
  if (index >= replies_.size()) throw std::out_of_range("pipeline reply index out of range");
  return replies_[index];
}

} // namespace tkv::store
