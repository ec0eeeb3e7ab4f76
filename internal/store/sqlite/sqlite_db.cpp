#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace tkv::store::sqlite {

Result Translate(sqlite3* db, int rc, const std::string& what) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const std::string message = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, message);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, message);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, message);
    case SQLITE_INTERRUPT:
      return Result::Err(ErrorCode::Cancelled, message);
    default:
      return Result::Err(ErrorCode::InternalError, message);
  }
}

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (auto result = Translate(db, rc, what); !result) {
    throw util::StoreError(result);
  }
}

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    auto result = Translate(db_, rc, "sqlite open " + path_);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreError(result);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  for (auto& [_, st] : statements_) {
    sqlite3_finalize(st);
  }
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    auto result    = Translate(nullptr, rc, "sqlite exec");
    result.message = "sqlite exec: " + msg;
    throw util::StoreError(result);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const char* sql) {
  if (auto it = statements_.find(sql); it != statements_.end()) {
    return it->second;
  }

  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  statements_.emplace(sql, stmt);
  return stmt;
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms_), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace tkv::store::sqlite
