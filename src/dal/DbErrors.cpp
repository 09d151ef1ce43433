#include "dal/DbErrors.hpp"

#include "common/Errors.hpp"

namespace authn::dal {

namespace {
constexpr const char* kReadOnlySqlTransaction = "25006";
constexpr const char* kForeignKeyViolation = "23503";
constexpr const char* kUniqueViolation = "23505";

std::string sqlstateOf(const pqxx::failure& ex) {
  const auto* pSqlErr = dynamic_cast<const pqxx::sql_error*>(&ex);
  return pSqlErr ? std::string(pSqlErr->sqlstate()) : std::string{};
}
}  // namespace

bool isReadOnlyFailure(const pqxx::failure& ex) {
  return sqlstateOf(ex) == kReadOnlySqlTransaction;
}

void rethrowAsStorageError(const pqxx::failure& ex, const std::string& sOperation) {
  const std::string sState = sqlstateOf(ex);
  const std::string sMsg = sOperation + " failed: " + ex.what();

  if (sState == kForeignKeyViolation) {
    throw common::ConstraintViolationError("unknown_user", sMsg);
  }
  if (sState == kUniqueViolation) {
    throw common::ConstraintViolationError("duplicate_token_digest", sMsg);
  }
  if (sState.rfind("23", 0) == 0) {
    throw common::ConstraintViolationError("constraint_violation", sMsg);
  }
  if (sState == kReadOnlySqlTransaction) {
    throw common::StorageError("read_only", sMsg, true);
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&ex) != nullptr) {
    throw common::StorageError("storage_unavailable", sMsg);
  }
  throw common::StorageError("storage_error", sMsg);
}

}  // namespace authn::dal
