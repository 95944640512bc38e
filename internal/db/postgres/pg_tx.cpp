#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace graphdoc::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode)
{
  conn_ = pool->Acquire();
  if (mode == TxMode::kReadOnly) {
    tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
  } else {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      GRAPHDOC_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the transaction must be gone before the connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
