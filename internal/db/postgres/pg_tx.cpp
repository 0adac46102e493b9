#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace wfrun::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TransactionMode mode)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
  if (mode == TransactionMode::kReadOnly) {
    tx_->exec("SET TRANSACTION READ ONLY");
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      WFRUN_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must be gone before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
