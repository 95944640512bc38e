#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace graphdoc::db::sqlite {

/*
  SQLite transaction wrapper.

  Write mode uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  and holds the connection's writer mutex until it finishes, because a
  connection can only run one transaction at a time.

  Read mode uses BEGIN DEFERRED; on a dedicated reader connection it
  takes no process-level lock at all.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode, bool shared_connection);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

}
