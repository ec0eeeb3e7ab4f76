#include "internal/keys/key_composer.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using tkv::keys::KeyComposer;

void TestComposeJoinsNamespaceAndSegments() {
  KeyComposer keys(std::string(tkv::keys::kDelimPipe), "orders");

  assert(keys.Compose({"a"}) == "orders|a");
  assert(keys.Compose({"customer-1", "order-7"}) == "orders|customer-1|order-7");
  assert(keys.IndexKey() == "orders|lmIdx");
}

void TestUnitDelimiterIsNonPrintable() {
  KeyComposer keys(std::string(tkv::keys::kDelimUnit), "ns");

  const auto key = keys.Compose({"x", "y"});
  assert(key == std::string("ns\x1fx\x1fy"));
  assert(key.size() == 6);
}

void TestNoSegmentsKeepsTrailingDelimiter() {
  KeyComposer keys("|", "ns");
  assert(keys.Compose({}) == "ns|");
}

void TestComposeIsDeterministic() {
  KeyComposer a("|", "ns");
  KeyComposer b("|", "ns");

  assert(a.Compose({"p", "q"}) == a.Compose({"p", "q"}));
  assert(a.Compose({"p", "q"}) == b.Compose({"p", "q"}));
}

void TestSegmentsContainingDelimiterCollide() {
  // documented caller error, not detected
  KeyComposer keys("|", "ns");
  assert(keys.Compose({"a|b"}) == keys.Compose({"a", "b"}));
}

} // namespace

int main() {
  TestComposeJoinsNamespaceAndSegments();
  TestUnitDelimiterIsNonPrintable();
  TestNoSegmentsKeepsTrailingDelimiter();
  TestComposeIsDeterministic();
  TestSegmentsContainingDelimiterCollide();

  std::cout << "tkv_unit_key_composer: pass\n";
  return 0;
}
