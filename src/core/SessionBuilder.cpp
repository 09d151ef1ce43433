#include "core/SessionBuilder.hpp"

#include "common/Errors.hpp"

#include <utility>

namespace authn::core {

void validateUserAgent(const std::string& sUserAgent, std::size_t nMaxBytes) {
  if (sUserAgent.size() > nMaxBytes) {
    throw common::ValidationError(
        "user_agent_too_long",
        "User agent is " + std::to_string(sUserAgent.size()) + " bytes (max " +
            std::to_string(nMaxBytes) + ")");
  }
}

std::string truncateUserAgent(const std::string& sUserAgent, std::size_t nMaxBytes) {
  if (sUserAgent.size() <= nMaxBytes) {
    return sUserAgent;
  }
  std::size_t nCut = nMaxBytes;
  // Back off continuation bytes (10xxxxxx) so the cut lands on a lead byte.
  while (nCut > 0 && (static_cast<unsigned char>(sUserAgent[nCut]) & 0xC0) == 0x80) {
    --nCut;
  }
  return sUserAgent.substr(0, nCut);
}

SessionBuilder::SessionBuilder(std::size_t nUserAgentMaxBytes)
    : _nUserAgentMaxBytes(nUserAgentMaxBytes) {}

SessionBuilder& SessionBuilder::userId(int64_t iUserId) {
  _oUserId = iUserId;
  return *this;
}

SessionBuilder& SessionBuilder::token(const std::string& sToken) {
  _oTokenDigest = security::TokenCodec::digest(sToken);
  return *this;
}

SessionBuilder& SessionBuilder::lastIpAddress(const common::IpAddress& ipAddress) {
  _oLastIpAddress = ipAddress;
  return *this;
}

SessionBuilder& SessionBuilder::lastUserAgent(std::string sUserAgent) {
  _oLastUserAgent = std::move(sUserAgent);
  return *this;
}

NewSession SessionBuilder::build() const {
  if (!_oUserId.has_value()) {
    throw common::ValidationError("missing_field", "`user_id` must be initialized");
  }
  if (!_oTokenDigest.has_value()) {
    throw common::ValidationError("missing_field", "`token` must be initialized");
  }
  if (!_oLastIpAddress.has_value()) {
    throw common::ValidationError("missing_field", "`last_ip_address` must be initialized");
  }
  if (!_oLastUserAgent.has_value()) {
    throw common::ValidationError("missing_field", "`last_user_agent` must be initialized");
  }
  validateUserAgent(*_oLastUserAgent, _nUserAgentMaxBytes);

  return NewSession{*_oUserId, *_oTokenDigest, *_oLastIpAddress, *_oLastUserAgent};
}

}  // namespace authn::core
