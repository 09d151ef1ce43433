#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace authn::common {

/// Base error for all library-level exceptions.
/// Carries HTTP status code and machine-readable error code slug so the
/// calling handler can map it to a response without inspecting messages.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: caller supplied incomplete or malformed input.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 503 Service Unavailable: backing store unreachable or refused the write.
/// _bReadOnly is set when the store reported a read-only transaction.
struct StorageError : AppError {
  bool _bReadOnly;

  explicit StorageError(std::string sCode, std::string sMsg, bool bReadOnly = false)
      : AppError(503, std::move(sCode), std::move(sMsg)), _bReadOnly(bReadOnly) {}

 protected:
  StorageError(int iHttpStatus, std::string sCode, std::string sMsg)
      : AppError(iHttpStatus, std::move(sCode), std::move(sMsg)), _bReadOnly(false) {}
};

/// 409 Conflict: the store rejected a row (unknown user, duplicate digest).
struct ConstraintViolationError : StorageError {
  explicit ConstraintViolationError(std::string sCode, std::string sMsg)
      : StorageError(409, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace authn::common
