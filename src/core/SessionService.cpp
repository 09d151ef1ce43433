#include "core/SessionService.hpp"

#include "core/SessionBuilder.hpp"
#include "dal/SessionRepository.hpp"
#include "security/TokenCodec.hpp"

#include <openssl/crypto.h>

#include <utility>

namespace authn::core {

SessionService::SessionService(dal::SessionRepository& srRepo, std::size_t nUserAgentMaxBytes)
    : _srRepo(srRepo), _nUserAgentMaxBytes(nUserAgentMaxBytes) {}

SessionService::~SessionService() = default;

IssuedSession SessionService::issue(int64_t iUserId, const common::IpAddress& ipAddress,
                                    const std::string& sUserAgent) {
  std::string sToken = security::TokenCodec::generateToken();

  try {
    const NewSession nsPending = SessionBuilder(_nUserAgentMaxBytes)
                                     .userId(iUserId)
                                     .token(sToken)
                                     .lastIpAddress(ipAddress)
                                     .lastUserAgent(sUserAgent)
                                     .build();
    auto srRecord = _srRepo.insert(nsPending);
    return IssuedSession{std::move(sToken), std::move(srRecord)};
  } catch (...) {
    // The token was never handed out; wipe it before propagating.
    OPENSSL_cleanse(sToken.data(), sToken.size());
    throw;
  }
}

std::optional<SessionRecord> SessionService::authenticate(const std::string& sToken,
                                                          const common::IpAddress& ipAddress,
                                                          const std::string& sUserAgent) {
  return _srRepo.findByTokenAndTouch(sToken, ipAddress, sUserAgent);
}

std::vector<SessionRecord> SessionService::listActive(int64_t iUserId) {
  return _srRepo.findByUserId(iUserId);
}

bool SessionService::revoke(int64_t iUserId, int64_t iSessionId) {
  return _srRepo.revoke(iUserId, iSessionId);
}

int SessionService::revokeAll(int64_t iUserId) { return _srRepo.revokeAllForUser(iUserId); }

}  // namespace authn::core
