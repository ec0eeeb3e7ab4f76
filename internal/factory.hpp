#pragma once

#include <cstdint>
#include <memory>

#include "config/config.pb.h"
#include "internal/core/timestamped_kv.hpp"
#include "internal/store/api/store.hpp"

namespace tkv::factory {

/*
  Application

  Owns the store and the record layer built on top of it.
*/
struct Application {
  std::shared_ptr<store::Store>       store;
  std::shared_ptr<core::TimestampedKv> kv;
  std::int64_t                        page_size = 100;
};

/*
  Build

  Constructs the store and record layer from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
Application Build(const tkv::runtime::config::RuntimeConfig& config);

// Keys config -> composer ("unit" or "pipe" delimiter). Throws util::InvalidConfig.
keys::KeyComposer BuildKeyComposer(const tkv::runtime::config::KeysConfig& keys);

} // namespace tkv::factory
