#include "pg_pool.hpp"

namespace tkv::store::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard relock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("select_string", "SELECT value FROM kv_string WHERE key=$1");
  conn.prepare("string_exists", "SELECT 1 FROM kv_string WHERE key=$1");
  conn.prepare("zset_exists", "SELECT 1 FROM kv_zset WHERE set_key=$1 LIMIT 1");

  conn.prepare("upsert_string",
               "INSERT INTO kv_string(key,value) VALUES($1,$2) "
               "ON CONFLICT(key) DO UPDATE SET value=excluded.value");
  conn.prepare("delete_string", "DELETE FROM kv_string WHERE key=$1");
  conn.prepare("delete_zset", "DELETE FROM kv_zset WHERE set_key=$1");

  // xmax = 0 only for freshly inserted rows
  conn.prepare("upsert_zmember",
               "INSERT INTO kv_zset(set_key,member,score) VALUES($1,$2,$3) "
               "ON CONFLICT(set_key,member) DO UPDATE SET score=excluded.score "
               "RETURNING (xmax = 0) AS inserted");
  conn.prepare("delete_zmember", "DELETE FROM kv_zset WHERE set_key=$1 AND member=$2");

  conn.prepare("count_zrange", "SELECT COUNT(*) FROM kv_zset WHERE set_key=$1 AND score>=$2 AND score<=$3");
  conn.prepare("select_zrange",
               "SELECT member FROM kv_zset WHERE set_key=$1 AND score>=$2 AND score<=$3 "
               "ORDER BY score, member LIMIT $4 OFFSET $5");
  conn.prepare("select_zrange_all",
               "SELECT member FROM kv_zset WHERE set_key=$1 AND score>=$2 AND score<=$3 "
               "ORDER BY score, member OFFSET $4");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      delete conn;
      --live_connections_;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace tkv::store::postgres
