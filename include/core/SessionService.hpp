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
class SessionRepository;
}  // namespace authn::dal

namespace authn::core {

/// A freshly issued session. sToken is the only copy of the plaintext;
/// hand it to the client and drop it.
/// Class abbreviation: is
struct IssuedSession {
  std::string sToken;
  SessionRecord srRecord;
};

/// Entry point for request handlers: issue, authenticate, list, revoke.
/// Class abbreviation: ss
class SessionService {
 public:
  explicit SessionService(dal::SessionRepository& srRepo,
                          std::size_t nUserAgentMaxBytes = common::kDefaultUserAgentMaxBytes);
  ~SessionService();

  /// Generate a token, persist its digest for iUserId and return both.
  IssuedSession issue(int64_t iUserId, const common::IpAddress& ipAddress,
                      const std::string& sUserAgent);

  /// Resolve a presented token to its active session, touching it.
  /// nullopt for unknown and revoked tokens alike. Unlike issue(), an
  /// oversized user agent is not an error here; it is stored truncated.
  std::optional<SessionRecord> authenticate(const std::string& sToken,
                                            const common::IpAddress& ipAddress,
                                            const std::string& sUserAgent);

  std::vector<SessionRecord> listActive(int64_t iUserId);

  bool revoke(int64_t iUserId, int64_t iSessionId);

  /// Sign out everywhere. Returns the number of sessions revoked.
  int revokeAll(int64_t iUserId);

 private:
  dal::SessionRepository& _srRepo;
  std::size_t _nUserAgentMaxBytes;
};

}  // namespace authn::core
