#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace graphdoc::db::postgres {

// Write mode runs pqxx::work, read mode pqxx::read_transaction. Each
// transaction holds its own pooled connection.
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode);
  ~PgTransaction();

  pqxx::transaction_base& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection>       conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  bool committed_ = false;
  bool finished_  = false;
};

}
