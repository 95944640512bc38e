#include "memory_tx.hpp"

#include <stdexcept>

namespace graphdoc::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  if (mode_ == TxMode::kReadWrite) {
    writer_lock_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);
  }

  std::scoped_lock lock(repo_.mutex_);
  snapshot_ = repo_.committed_;
  if (mode_ == TxMode::kReadWrite) {
    working_ = *snapshot_; // snapshot copy
  }
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ == TxMode::kReadOnly) {
    throw std::logic_error("write attempted on a read-only transaction");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }

  if (mode_ == TxMode::kReadWrite) {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::make_shared<const MemoryRepository::State>(std::move(working_));
  }
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace graphdoc::db::memory
