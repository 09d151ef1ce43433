#pragma once

#include <cstddef>
#include <string>

#include "common/Types.hpp"

namespace authn::common {

/// Environment variable loader for the session store.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;  // may embed credentials; never logged verbatim

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 10;
  int iDbCheckoutTimeoutSeconds = 30;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Session ───────────────────────────────────────────────────────────
  TouchFallback tfTouchFallback = TouchFallback::AnyWriteFailure;
  std::size_t nUserAgentMaxBytes = kDefaultUserAgentMaxBytes;

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for AUTHN_DB_URL.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

  /// Parse "any" / "read_only". Throws std::runtime_error otherwise.
  static TouchFallback parseTouchFallback(const std::string& sValue);

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace authn::common
