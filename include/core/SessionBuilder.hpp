#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "common/IpAddress.hpp"
#include "common/Types.hpp"
#include "core/SessionRecord.hpp"
#include "security/TokenCodec.hpp"

namespace authn::core {

/// Staged construction of a NewSession.
/// token() digests immediately; the plaintext is never stored here.
///
/// Usage:
///   auto nsPending = SessionBuilder()
///                        .userId(iUserId)
///                        .token(sToken)
///                        .lastIpAddress(ipClient)
///                        .lastUserAgent(sUa)
///                        .build();
/// Class abbreviation: sb
class SessionBuilder {
 public:
  explicit SessionBuilder(std::size_t nUserAgentMaxBytes = common::kDefaultUserAgentMaxBytes);

  SessionBuilder& userId(int64_t iUserId);
  SessionBuilder& token(const std::string& sToken);
  SessionBuilder& lastIpAddress(const common::IpAddress& ipAddress);
  SessionBuilder& lastUserAgent(std::string sUserAgent);

  /// Throws ValidationError naming the first missing field, or if the
  /// user agent exceeds the configured bound.
  NewSession build() const;

 private:
  std::size_t _nUserAgentMaxBytes;
  std::optional<int64_t> _oUserId;
  std::optional<security::Digest32> _oTokenDigest;
  std::optional<common::IpAddress> _oLastIpAddress;
  std::optional<std::string> _oLastUserAgent;
};

/// Throws ValidationError if sUserAgent is longer than nMaxBytes.
void validateUserAgent(const std::string& sUserAgent, std::size_t nMaxBytes);

/// sUserAgent cut to at most nMaxBytes, never inside a UTF-8 sequence.
std::string truncateUserAgent(const std::string& sUserAgent, std::size_t nMaxBytes);

}  // namespace authn::core
