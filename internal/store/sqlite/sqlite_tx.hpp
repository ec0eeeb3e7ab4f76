#pragma once

#include "sqlite_db.hpp"

namespace tkv::store::sqlite {

/*
  SQLite transaction scope.

  Immediate -> BEGIN IMMEDIATE, grabs the write lock up front (pipelines)
  Deferred  -> BEGIN, a read snapshot for script evaluation

  The caller must hold db.Mutex() for the lifetime of the scope.
  Destroyed without Commit() -> ROLLBACK.
*/
class SqliteTransaction {
 public:
  enum class Mode { Immediate, Deferred };

  SqliteTransaction(SqliteDB& db, Mode mode);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();
  void Rollback();

  bool IsFinished() const {
    return finished_;
  }

 private:
  SqliteDB& db_;
  bool      finished_ = false;
};

} // namespace tkv::store::sqlite
