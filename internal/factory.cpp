#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#if TKV_DB_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_store.hpp"
#endif
#if TKV_DB_POSTGRES
#include "internal/store/postgres/pg_pool.hpp"
#include "internal/store/postgres/pg_store.hpp"
#endif

namespace tkv::factory {

namespace {

constexpr std::int64_t kDefaultPageSize = 100;

std::shared_ptr<store::Store> BuildStore(const tkv::runtime::config::StoreConfig& config) {
  if (config.has_sqlite()) {
#if TKV_DB_SQLITE
    const auto& sqlite = config.sqlite();
    if (sqlite.path().empty()) throw util::InvalidConfig("store.sqlite.path is required");

    auto db = std::make_shared<store::sqlite::SqliteDB>(sqlite.path(),
                                                        sqlite.busy_timeout_ms() ? static_cast<int>(sqlite.busy_timeout_ms()) : 5000);
    auto backend = std::make_shared<store::sqlite::SqliteStore>(std::move(db));
    backend->Bootstrap();
    TKV_LOG_INFO("store ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path())});
    return backend;
#else
    throw util::InvalidConfig("sqlite backend requested but not enabled at build time");
#endif
  }

  if (config.has_postgres()) {
#if TKV_DB_POSTGRES
    const auto& pg = config.postgres();
    if (pg.connection_uri().empty()) throw util::InvalidConfig("store.postgres.connection_uri is required");

    auto pool    = std::make_shared<store::postgres::PgPool>(pg.connection_uri(), pg.max_connections() ? pg.max_connections() : 16);
    auto backend = std::make_shared<store::postgres::PgStore>(std::move(pool));
    backend->Bootstrap();
    TKV_LOG_INFO("store ready", {observability::StringField("backend", "postgres")});
    return backend;
#else
    throw util::InvalidConfig("postgres backend requested but not enabled at build time");
#endif
  }

  TKV_LOG_INFO("store ready", {observability::StringField("backend", "memory")});
  return std::make_shared<store::memory::MemoryStore>();
}

} // namespace

keys::KeyComposer BuildKeyComposer(const tkv::runtime::config::KeysConfig& keys) {
  std::string delimiter;
  if (keys.delimiter().empty() || keys.delimiter() == "unit") {
    delimiter = std::string(keys::kDelimUnit);
  } else if (keys.delimiter() == "pipe") {
    delimiter = std::string(keys::kDelimPipe);
  } else {
    throw util::InvalidConfig("keys.delimiter must be \"unit\" or \"pipe\", got \"" + keys.delimiter() + "\"");
  }
  return keys::KeyComposer(std::move(delimiter), keys.namespace_().empty() ? "tkv" : keys.namespace_());
}

Application Build(const tkv::runtime::config::RuntimeConfig& config) {
  const auto& paging = config.paging();
  if (paging.page_size() < 0) throw util::InvalidConfig("paging.page_size must not be negative");
  if (paging.max_consistent_page_size() < 0) throw util::InvalidConfig("paging.max_consistent_page_size must not be negative");

  Application app;
  app.store     = BuildStore(config.store());
  app.page_size = paging.page_size() > 0 ? paging.page_size() : kDefaultPageSize;

  const auto max_consistent =
      paging.max_consistent_page_size() > 0 ? paging.max_consistent_page_size() : core::TimestampedKv::kDefaultMaxConsistentPageSize;
  app.kv = std::make_shared<core::TimestampedKv>(app.store, BuildKeyComposer(config.keys()), max_consistent);
  return app;
}

} // namespace tkv::factory
