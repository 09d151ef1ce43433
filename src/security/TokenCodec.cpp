#include "security/TokenCodec.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace authn::security {

namespace {
constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr unsigned kAlphabetLen = sizeof(kAlphabet) - 1;  // 62
// Largest multiple of 62 that fits in a byte; bytes at or above it are
// rejected so every character is equally likely.
constexpr unsigned kRejectFrom = 256 - (256 % kAlphabetLen);  // 248

int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
}  // namespace

// ── Digest32 ───────────────────────────────────────────────────────────────

std::string Digest32::toHex() const {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned char c : aBytes) {
    oss << std::setw(2) << static_cast<int>(c);
  }
  return oss.str();
}

Digest32 Digest32::fromHex(const std::string& sHex) {
  if (sHex.size() != kSize * 2) {
    throw std::runtime_error("Invalid digest: expected " + std::to_string(kSize * 2) +
                             " hex characters, got " + std::to_string(sHex.size()));
  }
  Digest32 dg;
  for (std::size_t i = 0; i < kSize; ++i) {
    const int iHi = hexNibble(sHex[2 * i]);
    const int iLo = hexNibble(sHex[2 * i + 1]);
    if (iHi < 0 || iLo < 0) {
      throw std::runtime_error("Invalid hex character at position " + std::to_string(2 * i));
    }
    dg.aBytes[i] = static_cast<unsigned char>((iHi << 4) | iLo);
  }
  return dg;
}

// ── Token generation ───────────────────────────────────────────────────────

std::string TokenCodec::generateToken() {
  std::string sToken;
  sToken.reserve(kTokenLength);

  std::vector<unsigned char> vBytes(kTokenLength * 2);
  while (sToken.size() < kTokenLength) {
    if (RAND_bytes(vBytes.data(), static_cast<int>(vBytes.size())) != 1) {
      throw std::runtime_error("Failed to generate random bytes for session token");
    }
    for (unsigned char c : vBytes) {
      if (c >= kRejectFrom) continue;
      sToken.push_back(kAlphabet[c % kAlphabetLen]);
      if (sToken.size() == kTokenLength) break;
    }
  }

  OPENSSL_cleanse(vBytes.data(), vBytes.size());
  return sToken;
}

// ── Digest ─────────────────────────────────────────────────────────────────

Digest32 TokenCodec::digest(const std::string& sToken) {
  Digest32 dg;
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, sToken.data(), sToken.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, dg.aBytes.data(), &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("SHA-256 hash computation failed");
  }

  EVP_MD_CTX_free(pCtx);

  if (uHashLen != Digest32::kSize) {
    throw std::runtime_error("SHA-256 produced unexpected length " + std::to_string(uHashLen));
  }
  return dg;
}

bool TokenCodec::matches(const std::string& sToken, const Digest32& dgExpected) {
  const Digest32 dgActual = digest(sToken);
  return CRYPTO_memcmp(dgActual.aBytes.data(), dgExpected.aBytes.data(), Digest32::kSize) == 0;
}

}  // namespace authn::security
