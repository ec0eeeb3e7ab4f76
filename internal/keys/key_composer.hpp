#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tkv::keys {

// ASCII unit separator. Cannot appear in printable ids.
inline constexpr std::string_view kDelimUnit = "\x1f";

// Printable, easier to inspect. Ids containing '|' may collide.
inline constexpr std::string_view kDelimPipe = "|";

// Segment under which the ordering index lives.
inline constexpr std::string_view kIndexSuffix = "lmIdx";

/*
  Builds storage keys:

    namespace + delim + segment[0] + delim + segment[1] ...

  Segments that contain the delimiter are a caller error; the
  result is then not unique. Not checked.
*/
class KeyComposer {
 public:
  KeyComposer(std::string delimiter, std::string ns);

  std::string Compose(const std::vector<std::string>& segments) const;

  // Key of the ordering index for this namespace.
  std::string IndexKey() const;

  const std::string& Namespace() const {
    return namespace_;
  }
  const std::string& Delimiter() const {
    return delimiter_;
  }

 private:
  std::string delimiter_;
  std::string namespace_;
};

} // namespace tkv::keys
