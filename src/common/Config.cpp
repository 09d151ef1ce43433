#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace authn::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    const int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::string Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required variable not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("File is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

TouchFallback Config::parseTouchFallback(const std::string& sValue) {
  if (sValue == "any") {
    return TouchFallback::AnyWriteFailure;
  }
  if (sValue == "read_only") {
    return TouchFallback::ReadOnlyOnly;
  }
  throw std::runtime_error(
      "AUTHN_TOUCH_FALLBACK must be 'any' or 'read_only' (got '" + sValue + "')");
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = loadSecret("AUTHN_DB_URL");

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("AUTHN_DB_POOL_SIZE", 10);
  cfg.iDbCheckoutTimeoutSeconds = getEnvInt("AUTHN_DB_CHECKOUT_TIMEOUT_SECONDS", 30);

  const std::string sLogLevel = getEnv("AUTHN_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  const std::string sFallback = getEnv("AUTHN_TOUCH_FALLBACK");
  if (!sFallback.empty()) {
    cfg.tfTouchFallback = parseTouchFallback(sFallback);
  }

  const int iUaMax = getEnvInt("AUTHN_USER_AGENT_MAX_BYTES",
                               static_cast<int>(kDefaultUserAgentMaxBytes));

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iDbPoolSize < 1) {
    throw std::runtime_error(
        "AUTHN_DB_POOL_SIZE must be >= 1 (got " + std::to_string(cfg.iDbPoolSize) + ")");
  }

  if (cfg.iDbCheckoutTimeoutSeconds < 1) {
    throw std::runtime_error(
        "AUTHN_DB_CHECKOUT_TIMEOUT_SECONDS must be >= 1 (got " +
        std::to_string(cfg.iDbCheckoutTimeoutSeconds) + ")");
  }

  if (iUaMax < 1) {
    throw std::runtime_error(
        "AUTHN_USER_AGENT_MAX_BYTES must be >= 1 (got " + std::to_string(iUaMax) + ")");
  }
  cfg.nUserAgentMaxBytes = static_cast<std::size_t>(iUaMax);

  return cfg;
}

}  // namespace authn::common
