#include "common/IpAddress.hpp"

#include "common/Errors.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace authn::common {

IpAddress IpAddress::parse(const std::string& sText) {
  IpAddress ip;

  // Postgres renders INET host addresses without a mask, but accept "/32"
  // and "/128" so values read back through text() also round-trip.
  std::string sHost = sText;
  const auto nSlash = sHost.find('/');
  if (nSlash != std::string::npos) {
    const std::string sMask = sHost.substr(nSlash + 1);
    sHost.resize(nSlash);
    const bool bV6 = sHost.find(':') != std::string::npos;
    if (sMask != (bV6 ? "128" : "32")) {
      throw ValidationError("invalid_ip_address",
                            "Expected a host address, got network '" + sText + "'");
    }
  }

  if (inet_pton(AF_INET, sHost.c_str(), ip._aBytes.data()) == 1) {
    ip._family = Family::V4;
    return ip;
  }
  if (inet_pton(AF_INET6, sHost.c_str(), ip._aBytes.data()) == 1) {
    ip._family = Family::V6;
    return ip;
  }

  throw ValidationError("invalid_ip_address", "Not an IPv4 or IPv6 address: '" + sText + "'");
}

std::string IpAddress::toString() const {
  char vBuf[INET6_ADDRSTRLEN] = {};
  const int iAf = _family == Family::V6 ? AF_INET6 : AF_INET;
  if (inet_ntop(iAf, _aBytes.data(), vBuf, sizeof(vBuf)) == nullptr) {
    throw std::runtime_error(std::string("inet_ntop failed: ") + std::strerror(errno));
  }
  return std::string(vBuf);
}

}  // namespace authn::common
