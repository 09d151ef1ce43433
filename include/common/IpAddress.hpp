#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace authn::common {

/// A routable IPv4 or IPv6 host address.
/// Parsed from text with inet_pton; toString() yields the canonical form
/// written to the INET column, so two spellings of one address compare equal.
/// Class abbreviation: ip
class IpAddress {
 public:
  enum class Family { V4, V6 };

  /// Parse dotted-quad or RFC 4291 text. Throws ValidationError on failure.
  static IpAddress parse(const std::string& sText);

  Family family() const { return _family; }
  bool isV6() const { return _family == Family::V6; }

  /// Canonical text (inet_ntop).
  std::string toString() const;

  bool operator==(const IpAddress& other) const = default;

 private:
  IpAddress() = default;

  Family _family = Family::V4;
  std::array<uint8_t, 16> _aBytes{};  // only the first 4 used for V4
};

}  // namespace authn::common
