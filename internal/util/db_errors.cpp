#include "db_errors.hpp"

namespace graphdoc::util {

void ThrowDbError(const db::Result& result, const std::string& prefix) {
  const std::string message = prefix + ": " + (result.message.empty() ? std::string(db::ToString(result.code)) : result.message);

  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw ConstraintViolation(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::IOError:
      throw StoreUnavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

std::unique_ptr<db::Transaction> BeginOrThrow(db::Repository& repo, db::TxMode mode) {
  try {
    return repo.Begin(mode);
  } catch (const StoreUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw StoreUnavailable(std::string("begin transaction: ") + e.what());
  }
}

void CommitOrThrow(db::Transaction& tx) {
  try {
    tx.Commit();
  } catch (const std::exception& e) {
    throw StoreUnavailable(std::string("commit transaction: ") + e.what());
  }
}

} // namespace graphdoc::util
