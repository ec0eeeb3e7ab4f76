#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace tkv::store::postgres {

/*
  PgPool

  Bounded connection pool used by PgStore.

  - libpqxx connections are NOT thread-safe, one caller at a time.
  - Prepared statements are installed when a connection is opened.
  - Acquire() blocks while max_connections are checked out.

  Lifetime:
    PgStore owns shared_ptr<PgPool>
    PgTransaction holds shared_ptr<pqxx::connection>, returned on release
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace tkv::store::postgres
