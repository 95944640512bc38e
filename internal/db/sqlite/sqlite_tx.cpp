#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace graphdoc::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode, bool shared_connection) : db_(std::move(db)) {
  if (mode == TxMode::kReadWrite || shared_connection) {
    lock_ = std::unique_lock<std::mutex>(db_->WriterMutex());
  }
  db_->Exec(mode == TxMode::kReadWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      GRAPHDOC_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  if (lock_.owns_lock()) lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace graphdoc::db::sqlite
