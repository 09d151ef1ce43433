#pragma once

#include <string>

#include <pqxx/pqxx>

namespace authn::dal {

/// SQLSTATE 25006, raised when writing inside a read-only transaction
/// (hot standby, or default_transaction_read_only = on).
bool isReadOnlyFailure(const pqxx::failure& ex);

/// Translate a libpqxx failure into the library's StorageError family.
/// Integrity violations (class 23) become ConstraintViolationError.
[[noreturn]] void rethrowAsStorageError(const pqxx::failure& ex, const std::string& sOperation);

}  // namespace authn::dal
