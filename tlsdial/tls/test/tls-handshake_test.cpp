#include "tlsdial/tls-handshake.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/fake-tls.hpp"
#include "tlsdial/memory-transport.hpp"
#include "tlsdial/test-sockets.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

namespace {

using test::FakeStep;

class TlsHandshakeTest : public ::testing::Test {
 protected:
  TlsHandshake start(std::initializer_list<FakeStep> steps) {
    script->steps.assign(steps.begin(), steps.end());
    auto [client, server] = test::MakeMemoryTransportPair();
    peer = std::move(server);
    return {context, HandshakeParams{"example.com", true}, std::move(client)};
  }

  std::shared_ptr<test::FakeTlsScript> script = std::make_shared<test::FakeTlsScript>();
  test::FakeTlsContext context{script};
  std::unique_ptr<test::MemoryTransport> peer;
};

}  // namespace

TEST_F(TlsHandshakeTest, ImmediateSuccessCompletesOnFirstPoll) {
  script->alpn = "h2";
  auto handshake = start({FakeStep::Succeed});
  EXPECT_EQ(handshake.state(), TlsHandshake::State::Started);
  EXPECT_EQ(script->nbBegin, 1U);
  EXPECT_EQ(script->lastHostname, "example.com");
  EXPECT_TRUE(script->lastVerifyHostname);

  auto res = handshake.poll();
  ASSERT_TRUE(res.isReady());
  EXPECT_EQ(handshake.state(), TlsHandshake::State::Complete);
  EXPECT_EQ(res.value().session().negotiatedAlpn(), "h2");
  EXPECT_EQ(script->nbResume, 0U);
}

TEST_F(TlsHandshakeTest, ImmediateFailure) {
  auto handshake = start({FakeStep::Fail});
  auto res = handshake.poll();
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().kind(), ConnectError::Kind::HandshakeFailure);
  EXPECT_EQ(res.error().backendCode(), 42UL);
  EXPECT_EQ(handshake.state(), TlsHandshake::State::Failed);
}

TEST_F(TlsHandshakeTest, InterruptedFirstStepResumesOncePerPoll) {
  auto handshake = start({FakeStep::WantRead, FakeStep::WantWrite, FakeStep::WantRead, FakeStep::Succeed});
  EXPECT_EQ(script->nbPartialAlive, 1);

  auto res = handshake.poll();
  ASSERT_TRUE(res.isPending());
  EXPECT_EQ(res.want(), TransportHint::WriteReady);
  EXPECT_EQ(handshake.state(), TlsHandshake::State::Suspended);
  EXPECT_EQ(script->nbResume, 1U);

  res = handshake.poll();
  ASSERT_TRUE(res.isPending());
  EXPECT_EQ(res.want(), TransportHint::ReadReady);
  EXPECT_EQ(script->nbResume, 2U);

  res = handshake.poll();
  ASSERT_TRUE(res.isReady());
  EXPECT_EQ(script->nbResume, 3U);
  EXPECT_EQ(script->nbPartialAlive, 0);
  EXPECT_EQ(script->nbSessionAlive, 1);
  EXPECT_EQ(handshake.state(), TlsHandshake::State::Complete);
  EXPECT_EQ(script->nbBegin, 1U);
}

TEST_F(TlsHandshakeTest, FailureAfterInterruption) {
  auto handshake = start({FakeStep::WantWrite, FakeStep::Fail});
  auto res = handshake.poll();
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().kind(), ConnectError::Kind::HandshakeFailure);
  EXPECT_EQ(script->nbPartialAlive, 0);
}

TEST_F(TlsHandshakeTest, FdFollowsPartialSession) {
  script->steps = {FakeStep::WantRead};
  auto [lhs, rhs] = test::MakeSocketPair();
  const int fd = lhs.fd();
  TlsHandshake handshake(context, HandshakeParams{"example.com", false}, std::make_unique<TcpTransport>(std::move(lhs)));
  EXPECT_FALSE(script->lastVerifyHostname);
  EXPECT_EQ(handshake.fd(), fd);
  auto res = handshake.poll();
  ASSERT_TRUE(res.isReady());
  EXPECT_EQ(handshake.fd(), -1);
  EXPECT_EQ(res.value().fd(), fd);
}

TEST_F(TlsHandshakeTest, DroppingReleasesPartialSessionAndTransport) {
  {
    auto handshake = start({FakeStep::WantRead, FakeStep::WantRead});
    auto res = handshake.poll();
    ASSERT_TRUE(res.isPending());
    EXPECT_EQ(script->nbPartialAlive, 1);
  }
  EXPECT_EQ(script->nbPartialAlive, 0);
  EXPECT_EQ(script->nbSessionAlive, 0);
}

TEST_F(TlsHandshakeTest, WrapsAnExistingOutcome) {
  TlsHandshake handshake(HandshakeOutcome(ConnectError::HandshakeFailure(7, "bad certificate")));
  auto res = handshake.poll();
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().message(), "bad certificate");
}

using TlsHandshakeDeathTest = TlsHandshakeTest;

TEST_F(TlsHandshakeDeathTest, PollAfterCompletionAborts) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  auto handshake = start({FakeStep::Succeed});
  ASSERT_TRUE(handshake.poll().isReady());
  EXPECT_DEATH(static_cast<void>(handshake.poll()), "");
}

TEST_F(TlsHandshakeDeathTest, PollAfterFailureAborts) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  auto handshake = start({FakeStep::WantRead, FakeStep::Fail});
  ASSERT_TRUE(handshake.poll().isFailed());
  EXPECT_DEATH(static_cast<void>(handshake.poll()), "");
}

}  // namespace tlsdial
