#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "common/IpAddress.hpp"
#include "security/TokenCodec.hpp"

namespace authn::core {

/// A persisted session row.
/// created_at is immutable; last_used_at, last_ip_address and
/// last_user_agent only ever change together; revoked only goes
/// false -> true. user_id and token_digest have no update path.
/// Class abbreviation: sr
struct SessionRecord {
  int64_t iId;
  int64_t iUserId;
  security::Digest32 dgTokenDigest;
  std::chrono::system_clock::time_point tpCreatedAt;
  std::chrono::system_clock::time_point tpLastUsedAt;
  bool bRevoked;
  common::IpAddress ipLastAddress;
  std::string sLastUserAgent;
};

/// A built, not yet persisted session. Produced by SessionBuilder only.
/// Class abbreviation: ns
struct NewSession {
  int64_t iUserId;
  security::Digest32 dgTokenDigest;
  common::IpAddress ipLastAddress;
  std::string sLastUserAgent;
};

/// JSON view for active-session listings. Omits the token digest.
nlohmann::json toJson(const SessionRecord& sr);

/// ISO-8601 UTC with microseconds, e.g. "2024-05-01T12:00:00.123456Z".
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace authn::core
