#pragma once

namespace graphdoc::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Write transactions are serialized against each other; read
    transactions never wait for a writer

  SQLite: BEGIN IMMEDIATE (reads: BEGIN DEFERRED on a reader connection)
  Postgres: pqxx::work (reads: pqxx::read_transaction)
  Memory: snapshot copy-on-write
*/

enum class TxMode {
  kReadWrite,
  kReadOnly,
};

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
