#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace authn::security {

/// SHA-256 of a plaintext session token. The only form of a token that is
/// ever persisted or compared against stored data.
/// Class abbreviation: dg
struct Digest32 {
  static constexpr std::size_t kSize = 32;

  std::array<unsigned char, kSize> aBytes{};

  /// 64-char lowercase hex, the transport form for the BYTEA column.
  std::string toHex() const;

  /// Parse 64 hex chars (either case). Throws std::runtime_error otherwise.
  static Digest32 fromHex(const std::string& sHex);

  bool operator==(const Digest32& other) const = default;
};

/// Session token generation and digesting.
/// Class abbreviation: tc
class TokenCodec {
 public:
  static constexpr std::size_t kTokenLength = 32;

  /// Generate a plaintext token: kTokenLength chars from [A-Za-z0-9],
  /// drawn from RAND_bytes without modulo bias.
  static std::string generateToken();

  /// SHA-256 of the token bytes.
  static Digest32 digest(const std::string& sToken);

  /// Constant-time check that sToken digests to dgExpected.
  static bool matches(const std::string& sToken, const Digest32& dgExpected);
};

}  // namespace authn::security
