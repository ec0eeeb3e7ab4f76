#pragma once

#include <array>

namespace tkv::store::sql {

/*
  Canonical SQL for the relational backends.

  Written in the SQLite dialect with ? placeholders.
  Postgres prepares its own $n variants (see pg_pool.cpp).

  Layout:
    kv_string  one row per string key
    kv_zset    one row per (sorted set, member)
*/

// schema

static constexpr std::array<const char*, 3> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS kv_string (key BLOB PRIMARY KEY, value BLOB NOT NULL);",
    "CREATE TABLE IF NOT EXISTS kv_zset (set_key BLOB NOT NULL, member BLOB NOT NULL, score INTEGER NOT NULL,"
    " PRIMARY KEY (set_key, member));",
    "CREATE INDEX IF NOT EXISTS kv_zset_by_score ON kv_zset(set_key, score, member);"};

static constexpr std::array<const char*, 3> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS kv_string (key BYTEA PRIMARY KEY, value BYTEA NOT NULL);",
    "CREATE TABLE IF NOT EXISTS kv_zset (set_key BYTEA NOT NULL, member BYTEA NOT NULL, score BIGINT NOT NULL,"
    " PRIMARY KEY (set_key, member));",
    "CREATE INDEX IF NOT EXISTS kv_zset_by_score ON kv_zset(set_key, score, member);"};

// strings

static constexpr const char* SELECT_STRING = "SELECT value FROM kv_string WHERE key=?;";

static constexpr const char* STRING_EXISTS = "SELECT 1 FROM kv_string WHERE key=?;";

static constexpr const char* ZSET_EXISTS = "SELECT 1 FROM kv_zset WHERE set_key=? LIMIT 1;";

static constexpr const char* UPSERT_STRING =
    "INSERT INTO kv_string(key,value) VALUES(?,?)"
    " ON CONFLICT(key) DO UPDATE SET value=excluded.value;";

static constexpr const char* DELETE_STRING = "DELETE FROM kv_string WHERE key=?;";

// sorted sets

static constexpr const char* DELETE_ZSET = "DELETE FROM kv_zset WHERE set_key=?;";

static constexpr const char* SELECT_ZSCORE = "SELECT score FROM kv_zset WHERE set_key=? AND member=?;";

static constexpr const char* UPSERT_ZMEMBER =
    "INSERT INTO kv_zset(set_key,member,score) VALUES(?,?,?)"
    " ON CONFLICT(set_key,member) DO UPDATE SET score=excluded.score;";

static constexpr const char* DELETE_ZMEMBER = "DELETE FROM kv_zset WHERE set_key=? AND member=?;";

static constexpr const char* COUNT_ZRANGE = "SELECT COUNT(*) FROM kv_zset WHERE set_key=? AND score>=? AND score<=?;";

// LIMIT -1 means no limit in SQLite
static constexpr const char* SELECT_ZRANGE =
    "SELECT member FROM kv_zset WHERE set_key=? AND score>=? AND score<=?"
    " ORDER BY score, member LIMIT ? OFFSET ?;";

} // namespace tkv::store::sql
