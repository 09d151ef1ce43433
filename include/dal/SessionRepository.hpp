#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/IpAddress.hpp"
#include "common/Types.hpp"
#include "core/SessionRecord.hpp"

namespace authn::dal {

class ConnectionPool;

/// Manages the sessions table; insert, findByTokenAndTouch, findByUserId,
/// revoke, revokeAllForUser. Rows are never deleted here.
/// Every method throws StorageError (or ConstraintViolationError) when the
/// store fails; "no matching session" is an empty result, not an error.
/// Class abbreviation: sr
class SessionRepository {
 public:
  explicit SessionRepository(ConnectionPool& cpPool,
                             common::TouchFallback tfFallback =
                                 common::TouchFallback::AnyWriteFailure,
                             std::size_t nUserAgentMaxBytes = common::kDefaultUserAgentMaxBytes);
  ~SessionRepository();

  /// Insert a built session. Returns the stored row with its id and
  /// created_at == last_used_at == NOW().
  core::SessionRecord insert(const core::NewSession& nsSession);

  /// Digest sToken, find the unrevoked session with that digest and set
  /// last_used_at = NOW(), last_ip_address, last_user_agent in one UPDATE.
  /// Returns the updated row, or nullopt if no active session matches.
  /// A user agent over the configured bound is stored truncated.
  ///
  /// If the UPDATE transaction fails (per the configured TouchFallback),
  /// the same predicate is re-run as a plain SELECT and its row is
  /// returned without touching it.
  std::optional<core::SessionRecord> findByTokenAndTouch(const std::string& sToken,
                                                         const common::IpAddress& ipAddress,
                                                         const std::string& sUserAgent);

  /// All unrevoked sessions of a user, ordered by id.
  std::vector<core::SessionRecord> findByUserId(int64_t iUserId);

  /// Revoke session iSessionId if it belongs to iUserId and is still active.
  /// Returns true if a row changed.
  bool revoke(int64_t iUserId, int64_t iSessionId);

  /// Revoke every active session of a user. Returns rows changed.
  int revokeAllForUser(int64_t iUserId);

 private:
  std::optional<core::SessionRecord> findActiveByDigest(const std::string& sDigestHex);

  ConnectionPool& _cpPool;
  common::TouchFallback _tfFallback;
  std::size_t _nUserAgentMaxBytes;
};

}  // namespace authn::dal
