#include "core/SessionBuilder.hpp"

#include "common/Errors.hpp"
#include "common/IpAddress.hpp"
#include "security/TokenCodec.hpp"

#include <gtest/gtest.h>

#include <string>

using authn::common::IpAddress;
using authn::common::ValidationError;
using authn::core::NewSession;
using authn::core::SessionBuilder;
using authn::core::truncateUserAgent;
using authn::security::TokenCodec;

namespace {
const std::string kUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/51.0.2704.103 Safari/537.36";
}  // namespace

TEST(SessionBuilderTest, BuildsWithAllFields) {
  const std::string sToken = TokenCodec::generateToken();
  NewSession ns = SessionBuilder()
                      .userId(42)
                      .token(sToken)
                      .lastIpAddress(IpAddress::parse("192.168.0.42"))
                      .lastUserAgent(kUserAgent)
                      .build();

  EXPECT_EQ(ns.iUserId, 42);
  EXPECT_EQ(ns.dgTokenDigest, TokenCodec::digest(sToken));
  EXPECT_EQ(ns.ipLastAddress, IpAddress::parse("192.168.0.42"));
  EXPECT_EQ(ns.sLastUserAgent, kUserAgent);
}

TEST(SessionBuilderTest, MissingUserIdFails) {
  SessionBuilder sb;
  sb.token("t").lastIpAddress(IpAddress::parse("::1")).lastUserAgent("ua");
  try {
    sb.build();
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e._sErrorCode, "missing_field");
    EXPECT_NE(std::string(e.what()).find("user_id"), std::string::npos);
  }
}

TEST(SessionBuilderTest, MissingTokenFails) {
  SessionBuilder sb;
  sb.userId(1).lastIpAddress(IpAddress::parse("::1")).lastUserAgent("ua");
  EXPECT_THROW(sb.build(), ValidationError);
}

TEST(SessionBuilderTest, MissingIpAddressFails) {
  SessionBuilder sb;
  sb.userId(1).token("t").lastUserAgent("ua");
  EXPECT_THROW(sb.build(), ValidationError);
}

TEST(SessionBuilderTest, MissingUserAgentFails) {
  SessionBuilder sb;
  sb.userId(1).token("t").lastIpAddress(IpAddress::parse("10.0.0.1"));
  EXPECT_THROW(sb.build(), ValidationError);
}

TEST(SessionBuilderTest, EmptyUserAgentIsAllowed) {
  NewSession ns = SessionBuilder()
                      .userId(1)
                      .token("t")
                      .lastIpAddress(IpAddress::parse("10.0.0.1"))
                      .lastUserAgent("")
                      .build();
  EXPECT_EQ(ns.sLastUserAgent, "");
}

TEST(SessionBuilderTest, UserAgentOverBoundFails) {
  SessionBuilder sb(16);
  sb.userId(1).token("t").lastIpAddress(IpAddress::parse("10.0.0.1"));

  sb.lastUserAgent(std::string(16, 'a'));
  EXPECT_NO_THROW(sb.build());

  sb.lastUserAgent(std::string(17, 'a'));
  try {
    sb.build();
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e._sErrorCode, "user_agent_too_long");
  }
}

TEST(TruncateUserAgentTest, LeavesShortAgentsAlone) {
  EXPECT_EQ(truncateUserAgent("curl/8.5.0", 16), "curl/8.5.0");
  EXPECT_EQ(truncateUserAgent(std::string(16, 'a'), 16), std::string(16, 'a'));
}

TEST(TruncateUserAgentTest, CutsToBound) {
  EXPECT_EQ(truncateUserAgent(std::string(5000, 'a'), 1024), std::string(1024, 'a'));
}

TEST(TruncateUserAgentTest, NeverSplitsMultibyteCharacter) {
  // "abc" followed by U+00E9 (2 bytes) and U+20AC (3 bytes).
  const std::string sAgent = "abc\xC3\xA9\xE2\x82\xAC";
  EXPECT_EQ(truncateUserAgent(sAgent, 4), "abc");
  EXPECT_EQ(truncateUserAgent(sAgent, 5), "abc\xC3\xA9");
  EXPECT_EQ(truncateUserAgent(sAgent, 7), "abc\xC3\xA9");
  EXPECT_EQ(truncateUserAgent(sAgent, 8), sAgent);
}

TEST(SessionBuilderTest, LaterSetterWins) {
  NewSession ns = SessionBuilder()
                      .userId(1)
                      .userId(2)
                      .token("first")
                      .token("second")
                      .lastIpAddress(IpAddress::parse("10.0.0.1"))
                      .lastUserAgent("ua")
                      .build();
  EXPECT_EQ(ns.iUserId, 2);
  EXPECT_EQ(ns.dgTokenDigest, TokenCodec::digest("second"));
}
