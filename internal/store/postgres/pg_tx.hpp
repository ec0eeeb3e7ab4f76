#pragma once

#include <memory>
#include <optional>
#include <pqxx/pqxx>

#include "pg_pool.hpp"

namespace tkv::store::postgres {

/*
  One pooled connection + one transaction on it.

  ReadWrite -> read committed work, used by pipelines
  Snapshot  -> repeatable read, read only, used by script evaluation

  Destroyed without Commit() -> abort.
*/
class PgTransaction {
 public:
  enum class Mode { ReadWrite, Snapshot };

  PgTransaction(PgPool& pool, Mode mode);
  ~PgTransaction();

  PgTransaction(const PgTransaction&)            = delete;
  PgTransaction& operator=(const PgTransaction&) = delete;

  pqxx::transaction_base& Work();

  void Commit();
  void Rollback();

 private:
  using SnapshotTx = pqxx::transaction<pqxx::isolation_level::repeatable_read, pqxx::write_policy::read_only>;

  std::shared_ptr<pqxx::connection> conn_;
  std::optional<pqxx::work>         work_;
  std::optional<SnapshotTx>         snapshot_;
  bool                              finished_ = false;
};

} // namespace tkv::store::postgres
