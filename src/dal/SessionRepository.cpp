#include "dal/SessionRepository.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/SessionBuilder.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/DbErrors.hpp"
#include "security/TokenCodec.hpp"

#include <chrono>
#include <optional>
#include <utility>

#include <pqxx/pqxx>

namespace authn::dal {

namespace {

// Column order must match rowToRecord().
constexpr const char* kColumns =
    "id, user_id, encode(token_digest, 'hex'), "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::bigint, "
    "(EXTRACT(EPOCH FROM last_used_at) * 1000000)::bigint, "
    "revoked, host(last_ip_address), last_user_agent";

std::chrono::system_clock::time_point fromEpochMicros(int64_t iMicros) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::microseconds(iMicros)));
}

core::SessionRecord rowToRecord(const pqxx::row& row) {
  return core::SessionRecord{
      row[0].as<int64_t>(),
      row[1].as<int64_t>(),
      security::Digest32::fromHex(row[2].as<std::string>()),
      fromEpochMicros(row[3].as<int64_t>()),
      fromEpochMicros(row[4].as<int64_t>()),
      row[5].as<bool>(),
      common::IpAddress::parse(row[6].as<std::string>()),
      row[7].as<std::string>(),
  };
}

// Log-safe handle for a session: first 8 hex chars of the digest.
std::string digestPrefix(const std::string& sDigestHex) { return sDigestHex.substr(0, 8); }

}  // namespace

SessionRepository::SessionRepository(ConnectionPool& cpPool, common::TouchFallback tfFallback,
                                     std::size_t nUserAgentMaxBytes)
    : _cpPool(cpPool), _tfFallback(tfFallback), _nUserAgentMaxBytes(nUserAgentMaxBytes) {}

SessionRepository::~SessionRepository() = default;

core::SessionRecord SessionRepository::insert(const core::NewSession& nsSession) {
  std::optional<core::SessionRecord> oCreated;
  {
    auto cg = _cpPool.checkout();
    try {
      pqxx::work txn(*cg);
      auto result = txn.exec(
          std::string("INSERT INTO sessions "
                      "(user_id, token_digest, last_ip_address, last_user_agent) "
                      "VALUES ($1, decode($2, 'hex'), $3::inet, $4) RETURNING ") +
              kColumns,
          pqxx::params{nsSession.iUserId, nsSession.dgTokenDigest.toHex(),
                       nsSession.ipLastAddress.toString(), nsSession.sLastUserAgent});
      oCreated = rowToRecord(result.one_row());
      txn.commit();
    } catch (const pqxx::failure& ex) {
      rethrowAsStorageError(ex, "insert session");
    }
  }

  // Committed: nothing below may turn this into a reported failure.
  common::Logger::get()->debug("Session {} created for user {}", oCreated->iId,
                               oCreated->iUserId);
  return std::move(*oCreated);
}

std::optional<core::SessionRecord> SessionRepository::findByTokenAndTouch(
    const std::string& sToken, const common::IpAddress& ipAddress,
    const std::string& sUserAgent) {
  // A valid token still authenticates with an oversized agent; only the
  // stored copy is cut to the bound.
  const std::string sStoredAgent = core::truncateUserAgent(sUserAgent, _nUserAgentMaxBytes);

  const std::string sDigestHex = security::TokenCodec::digest(sToken).toHex();

  // Write path: a single UPDATE ... RETURNING. An empty result means no
  // active session matched and is returned as-is; only a failure of the
  // transaction itself may lead to the read fallback below.
  {
    auto cg = _cpPool.checkout();
    try {
      pqxx::work txn(*cg);
      auto result = txn.exec(
          std::string("UPDATE sessions SET "
                      "last_used_at = NOW(), "
                      "last_ip_address = $2::inet, "
                      "last_user_agent = $3 "
                      "WHERE token_digest = decode($1, 'hex') AND revoked = FALSE "
                      "RETURNING ") +
              kColumns,
          pqxx::params{sDigestHex, ipAddress.toString(), sStoredAgent});
      txn.commit();

      if (result.empty()) {
        return std::nullopt;
      }
      return rowToRecord(result[0]);
    } catch (const pqxx::failure& ex) {
      if (_tfFallback == common::TouchFallback::ReadOnlyOnly && !isReadOnlyFailure(ex)) {
        rethrowAsStorageError(ex, "touch session");
      }
      common::Logger::get()->warn(
          "Session touch failed for digest {}..., falling back to read-only lookup: {}",
          digestPrefix(sDigestHex), ex.what());
    }
  }  // connection goes back before the fallback checks one out

  return findActiveByDigest(sDigestHex);
}

std::optional<core::SessionRecord> SessionRepository::findActiveByDigest(
    const std::string& sDigestHex) {
  auto cg = _cpPool.checkout();
  try {
    pqxx::read_transaction txn(*cg);
    auto result = txn.exec(
        std::string("SELECT ") + kColumns +
            " FROM sessions WHERE token_digest = decode($1, 'hex') AND revoked = FALSE",
        pqxx::params{sDigestHex});
    txn.commit();

    if (result.empty()) {
      return std::nullopt;
    }
    return rowToRecord(result[0]);
  } catch (const pqxx::failure& ex) {
    rethrowAsStorageError(ex, "find session");
  }
}

std::vector<core::SessionRecord> SessionRepository::findByUserId(int64_t iUserId) {
  auto cg = _cpPool.checkout();
  try {
    pqxx::read_transaction txn(*cg);
    auto result = txn.exec(
        std::string("SELECT ") + kColumns +
            " FROM sessions WHERE user_id = $1 AND revoked = FALSE ORDER BY id",
        pqxx::params{iUserId});
    txn.commit();

    std::vector<core::SessionRecord> vSessions;
    vSessions.reserve(static_cast<size_t>(result.size()));
    for (const auto& row : result) {
      vSessions.push_back(rowToRecord(row));
    }
    return vSessions;
  } catch (const pqxx::failure& ex) {
    rethrowAsStorageError(ex, "list sessions");
  }
}

bool SessionRepository::revoke(int64_t iUserId, int64_t iSessionId) {
  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    auto result = txn.exec(
        "UPDATE sessions SET revoked = TRUE "
        "WHERE id = $1 AND user_id = $2 AND revoked = FALSE",
        pqxx::params{iSessionId, iUserId});
    txn.commit();

    const bool bChanged = result.affected_rows() == 1;
    if (bChanged) {
      common::Logger::get()->info("Session {} of user {} revoked", iSessionId, iUserId);
    }
    return bChanged;
  } catch (const pqxx::failure& ex) {
    rethrowAsStorageError(ex, "revoke session");
  }
}

int SessionRepository::revokeAllForUser(int64_t iUserId) {
  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    auto result = txn.exec(
        "UPDATE sessions SET revoked = TRUE WHERE user_id = $1 AND revoked = FALSE",
        pqxx::params{iUserId});
    txn.commit();

    const int iChanged = static_cast<int>(result.affected_rows());
    if (iChanged > 0) {
      common::Logger::get()->info("Revoked {} sessions of user {}", iChanged, iUserId);
    }
    return iChanged;
  } catch (const pqxx::failure& ex) {
    rethrowAsStorageError(ex, "revoke sessions");
  }
}

}  // namespace authn::dal
