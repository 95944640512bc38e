#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace graphdoc::db::memory {

/*
  Transaction = snapshot + write set

  Write transactions hold the repository writer lock until they finish,
  so two writers never work from the same snapshot and uniqueness checks
  stay race-free. Read transactions share the committed snapshot and
  never wait for a writer.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Throws std::logic_error on a read-only transaction.
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return mode_ == TxMode::kReadOnly ? *snapshot_ : working_;
  }

 private:
  MemoryRepository&                              repo_;
  TxMode                                         mode_;
  std::unique_lock<std::mutex>                   writer_lock_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  MemoryRepository::State                        working_;
  bool                                           committed_   = false;
  bool                                           rolled_back_ = false;
};

} // namespace graphdoc::db::memory
