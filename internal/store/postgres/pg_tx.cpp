#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace tkv::store::postgres {

PgTransaction::PgTransaction(PgPool& pool, Mode mode) : conn_(pool.Acquire()) {
  if (mode == Mode::Snapshot) {
    snapshot_.emplace(*conn_);
  } else {
    work_.emplace(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;

  try {
    Work().abort();
  } catch (const std::exception& e) {
    TKV_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
  }
}

pqxx::transaction_base& PgTransaction::Work() {
  if (snapshot_) return *snapshot_;
  return *work_;
}

void PgTransaction::Commit() {
  Work().commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  Work().abort();
  finished_ = true;
}

} // namespace tkv::store::postgres
