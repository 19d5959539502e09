#include "tlsdial/connect-error.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

#include "tlsdial/poll-result.hpp"

namespace tlsdial {

TEST(ConnectErrorTest, ConnectCarriesErrno) {
  auto err = ConnectError::Connect(ECONNREFUSED, "connect to 127.0.0.1:1");
  EXPECT_EQ(err.kind(), ConnectError::Kind::Connect);
  EXPECT_EQ(err.code(), std::error_code(ECONNREFUSED, std::system_category()));
  EXPECT_EQ(err.code(), std::errc::connection_refused);
  EXPECT_TRUE(err.message().starts_with("connect to 127.0.0.1:1: "));
  EXPECT_EQ(err.backendCode(), 0UL);
}

TEST(ConnectErrorTest, HandshakeFailure) {
  auto err = ConnectError::HandshakeFailure(62, "hostname mismatch");
  EXPECT_EQ(err.kind(), ConnectError::Kind::HandshakeFailure);
  EXPECT_EQ(err.code(), std::errc::protocol_error);
  EXPECT_EQ(err.backendCode(), 62UL);
  EXPECT_EQ(err.message(), "hostname mismatch");
}

TEST(ConnectErrorTest, ProtocolPolicy) {
  auto err = ConnectError::ProtocolPolicy("http");
  EXPECT_EQ(err.kind(), ConnectError::Kind::ProtocolPolicy);
  EXPECT_EQ(err.code(), std::errc::protocol_not_supported);
  EXPECT_NE(err.message().find("'http'"), std::string::npos);
  EXPECT_EQ(KindName(err.kind()), "ProtocolPolicy");
}

TEST(PollResultTest, States) {
  auto pending = PollResult<std::string>::NotReady(TransportHint::WriteReady);
  EXPECT_TRUE(pending.isPending());
  EXPECT_EQ(pending.want(), TransportHint::WriteReady);

  auto ready = PollResult<std::string>::Ready("done");
  EXPECT_TRUE(ready.isReady());
  EXPECT_EQ(ready.want(), TransportHint::None);
  EXPECT_EQ(ready.value(), "done");

  auto failed = PollResult<std::string>::Failed(ConnectError::ProtocolPolicy("ws"));
  EXPECT_TRUE(failed.isFailed());
  EXPECT_EQ(failed.error().kind(), ConnectError::Kind::ProtocolPolicy);
}

TEST(PollResultTest, PropagateKeepsPendingAndFailure) {
  auto pending = PollResult<int>::NotReady(TransportHint::ReadReady).propagate<std::string>();
  EXPECT_TRUE(pending.isPending());
  EXPECT_EQ(pending.want(), TransportHint::ReadReady);

  auto failed = PollResult<int>::Failed(ConnectError::Connect(ETIMEDOUT, "x")).propagate<std::string>();
  ASSERT_TRUE(failed.isFailed());
  EXPECT_EQ(failed.error().code(), std::errc::timed_out);
}

}  // namespace tlsdial
