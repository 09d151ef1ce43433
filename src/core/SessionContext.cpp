#include "core/SessionContext.hpp"

#include "common/Logger.hpp"
#include "core/SessionService.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/SessionRepository.hpp"

#include <chrono>

namespace authn::core {

SessionContext::SessionContext(const common::Config& cfgApp) {
  // ── Logging ──────────────────────────────────────────────────────────
  common::Logger::init(cfgApp.sLogLevel);
  auto spLog = common::Logger::get();

  // ── Storage ──────────────────────────────────────────────────────────
  _upPool = std::make_unique<dal::ConnectionPool>(
      cfgApp.sDbUrl, cfgApp.iDbPoolSize, std::chrono::seconds(cfgApp.iDbCheckoutTimeoutSeconds));
  _upRepo = std::make_unique<dal::SessionRepository>(*_upPool, cfgApp.tfTouchFallback,
                                                     cfgApp.nUserAgentMaxBytes);

  // ── Service ──────────────────────────────────────────────────────────
  _upService = std::make_unique<SessionService>(*_upRepo, cfgApp.nUserAgentMaxBytes);

  spLog->info("Session store ready (pool={}, touch fallback={}, user agent max={} bytes)",
              cfgApp.iDbPoolSize,
              cfgApp.tfTouchFallback == common::TouchFallback::ReadOnlyOnly ? "read_only" : "any",
              cfgApp.nUserAgentMaxBytes);
}

SessionContext::~SessionContext() = default;

std::unique_ptr<SessionContext> SessionContext::fromEnvironment() {
  return std::make_unique<SessionContext>(common::Config::load());
}

}  // namespace authn::core
