#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tkv::store {

/*
  Generic reply tree returned by script evaluation.

  Mirrors the shapes a scripted store can hand back: nil, integer,
  bulk string, or a nested array of replies. Callers must check the
  type before using an accessor; accessors on the wrong type throw
  std::logic_error.
*/
class Reply {
 public:
  enum class Type { Nil, Integer, String, Array };

  Reply() = default;

  static Reply Nil();
  static Reply Integer(std::int64_t value);
  static Reply String(std::string value);
  static Reply Array(std::vector<Reply> elements);

  // Array of strings, with nil for each absent value.
  static Reply FromValues(std::vector<std::optional<std::string>> values);

  Type type() const {
    return type_;
  }
  bool IsNil() const {
    return type_ == Type::Nil;
  }
  bool IsInteger() const {
    return type_ == Type::Integer;
  }
  bool IsString() const {
    return type_ == Type::String;
  }
  bool IsArray() const {
    return type_ == Type::Array;
  }

  std::int64_t              integer() const;
  const std::string&        str() const;
  const std::vector<Reply>& elements() const;

 private:
  Type               type_    = Type::Nil;
  std::int64_t       integer_ = 0;
  std::string        str_;
  std::vector<Reply> elements_;
};

const char* ReplyTypeName(Reply::Type type);

} // namespace tkv::store
