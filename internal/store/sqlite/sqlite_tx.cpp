#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace tkv::store::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db, Mode mode) : db_(db) {
  db_.Exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  try {
    db_.Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    TKV_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  db_.Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace tkv::store::sqlite
