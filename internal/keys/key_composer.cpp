#include "internal/keys/key_composer.hpp"

namespace tkv::keys {

KeyComposer::KeyComposer(std::string delimiter, std::string ns)
    : delimiter_(std::move(delimiter)), namespace_(std::move(ns)) {
}

std::string KeyComposer::Compose(const std::vector<std::string>& segments) const {
  std::size_t size = namespace_.size() + delimiter_.size();
  for (const auto& s : segments) {
    size += s.size() + delimiter_.size();
  }

  std::string key;
  key.reserve(size);
  key.append(namespace_).append(delimiter_);
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) key.append(delimiter_);
    key.append(segments[i]);
  }
  return key;
}

std::string KeyComposer::IndexKey() const {
  return Compose({std::string(kIndexSuffix)});
}

} // namespace tkv::keys
