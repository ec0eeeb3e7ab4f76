#include "reply.hpp"

#include <stdexcept>

namespace tkv::store {

Reply Reply::Nil() {
  return Reply();
}

Reply Reply::Integer(std::int64_t value) {
  Reply r;
  r.type_    = Type::Integer;
  r.integer_ = value;
  return r;
}

Reply Reply::String(std::string value) {
  Reply r;
  r.type_ = Type::String;
  r.str_  = std::move(value);
  return r;
}

Reply Reply::Array(std::vector<Reply> elements) {
  Reply r;
  r.type_     = Type::Array;
  r.elements_ = std::move(elements);
  return r;
}

Reply Reply::FromValues(std::vector<std::optional<std::string>> values) {
  std::vector<Reply> elements;
  elements.reserve(values.size());
  for (auto& value : values) {
    elements.push_back(value ? String(std::move(*value)) : Nil());
  }
  return Array(std::move(elements));
}

std::int64_t Reply::integer() const {
  if (type_ != Type::Integer) throw std::logic_error(std::string("reply is not an integer but ") + ReplyTypeName(type_));
  return integer_;
}

const std::string& Reply::str() const {
  if (type_ != Type::String) throw std::logic_error(std::string("reply is not a string but ") + ReplyTypeName(type_));
  return str_;
}

const std::vector<Reply>& Reply::elements() const {
  if (type_ != Type::Array) throw std::logic_error(std::string("reply is not an array but ") + ReplyTypeName(type_));
  return elements_;
}

const char* ReplyTypeName(Reply::Type type) {
  switch (type) {
    case Reply::Type::Nil:
      return "nil";
    case Reply::Type::Integer:
      return "integer";
    case Reply::Type::String:
      return "string";
    case Reply::Type::Array:
      return "array";
  }
  return "unknown";
}

} // namespace tkv::store
