#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace graphdoc::util {

/*
  db::Result -> exception mapping shared by the domain modules.

  AlreadyExists carries the caller's duplicate type; every transport
  failure (busy, conflict, serialization, I/O) becomes StoreUnavailable.
*/

[[noreturn]] void ThrowDbError(const db::Result& result, const std::string& prefix);

template <typename Duplicate>
void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw Duplicate(prefix + ": " + result.message);
  }
  ThrowDbError(result, prefix);
}

inline void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  ThrowDbError(result, prefix);
}

std::unique_ptr<db::Transaction> BeginOrThrow(db::Repository& repo, db::TxMode mode = db::TxMode::kReadWrite);

void CommitOrThrow(db::Transaction& tx);

} // namespace graphdoc::util
