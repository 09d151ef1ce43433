#include "core/SessionContext.hpp"

#include "DbTestSupport.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/IpAddress.hpp"
#include "core/SessionService.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/SessionRepository.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

using authn::common::Config;
using authn::common::IpAddress;
using authn::common::TouchFallback;
using authn::common::ValidationError;
using authn::core::SessionContext;

class SessionContextTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = authn::test::getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "AUTHN_DB_URL not set — skipping integration test";
    }
  }

  void TearDown() override {
    unsetenv("AUTHN_DB_POOL_SIZE");
    unsetenv("AUTHN_LOG_LEVEL");
    spdlog::default_logger()->set_level(spdlog::level::warn);
  }

  std::string _sDbUrl;
};

TEST_F(SessionContextTest, WiresConfigIntoPoolLoggerAndService) {
  Config cfg;
  cfg.sDbUrl = _sDbUrl;
  cfg.iDbPoolSize = 3;
  cfg.iDbCheckoutTimeoutSeconds = 5;
  cfg.sLogLevel = "error";
  cfg.tfTouchFallback = TouchFallback::ReadOnlyOnly;
  cfg.nUserAgentMaxBytes = 8;

  SessionContext scCtx(cfg);
  EXPECT_EQ(scCtx.pool().size(), 3);
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);

  authn::test::resetSchema(scCtx.pool());
  const int64_t iUserId = authn::test::createUser(scCtx.pool(), "johndoe");

  // The configured user-agent bound reaches the service.
  EXPECT_THROW(scCtx.service().issue(iUserId, IpAddress::parse("10.0.0.1"), "123456789"),
               ValidationError);

  auto is = scCtx.service().issue(iUserId, IpAddress::parse("10.0.0.1"), "12345678");
  auto oSession = scCtx.service().authenticate(is.sToken, IpAddress::parse("10.0.0.2"),
                                               "a longer agent");
  ASSERT_TRUE(oSession.has_value());
  // ...and the repository, which stores the touch agent cut to the bound.
  EXPECT_EQ(oSession->sLastUserAgent, "a longer");
  EXPECT_EQ(scCtx.repository().findByUserId(iUserId).size(), 1u);
}

TEST_F(SessionContextTest, FromEnvironmentReadsAuthnVariables) {
  setenv("AUTHN_DB_POOL_SIZE", "2", 1);
  setenv("AUTHN_LOG_LEVEL", "warn", 1);

  auto upCtx = SessionContext::fromEnvironment();
  ASSERT_NE(upCtx, nullptr);
  EXPECT_EQ(upCtx->pool().size(), 2);
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
}
