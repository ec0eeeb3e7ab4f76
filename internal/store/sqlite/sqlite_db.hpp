#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/store/api/result.hpp"

namespace tkv::store::sqlite {

/*
  Thin RAII wrapper around sqlite3* + prepared statement cache.

  One connection, one mutex. Callers hold Mutex() for the whole
  unit of work (a transaction or a single read) so statements from
  different threads never interleave inside a transaction.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& Mutex() {
    return mutex_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Cached prepared statement, reset and unbound. Owned by the cache.
  sqlite3_stmt* Prepare(const char* sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  const std::string& Path() const {
    return path_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
  std::mutex  mutex_;

  std::unordered_map<std::string, sqlite3_stmt*> statements_;
};

// Maps a sqlite return code onto the portable codes.
Result Translate(sqlite3* db, int rc, const std::string& what);

// Throws StoreError unless rc is OK/ROW/DONE.
void ThrowIf(int rc, sqlite3* db, const std::string& what);

/*
  Resets a cached statement when the step sequence is done,
  whichever way the scope is left.
*/
class StatementScope {
 public:
  explicit StatementScope(sqlite3_stmt* st) : st_(st) {
  }
  ~StatementScope() {
    sqlite3_reset(st_);
    sqlite3_clear_bindings(st_);
  }

  StatementScope(const StatementScope&)            = delete;
  StatementScope& operator=(const StatementScope&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_;
};

} // namespace tkv::store::sqlite
