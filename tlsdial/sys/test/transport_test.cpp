#include "tlsdial/transport.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <string_view>
#include <utility>

#include "tlsdial/base-fd.hpp"
#include "tlsdial/test-sockets.hpp"

namespace tlsdial {

TEST(TcpTransport, ReadReturnsErrorWhenFdIsInvalid) {
  TcpTransport transport(BaseFd{});
  char buf[16];
  const auto res = transport.read(buf, sizeof(buf));
  EXPECT_EQ(res.bytesProcessed, 0U);
  EXPECT_EQ(res.want, TransportHint::Error);
}

TEST(TcpTransport, WriteReturnsErrorWhenFdIsInvalid) {
  TcpTransport transport(BaseFd{});
  const auto res = transport.write("hello");
  EXPECT_EQ(res.bytesProcessed, 0U);
  EXPECT_EQ(res.want, TransportHint::Error);
}

TEST(TcpTransport, RoundTrip) {
  auto [lhs, rhs] = test::MakeSocketPair();
  TcpTransport client(std::move(lhs));
  TcpTransport server(std::move(rhs));

  const auto written = client.write("ping");
  EXPECT_EQ(written.bytesProcessed, 4U);
  EXPECT_EQ(written.want, TransportHint::None);

  char buf[16];
  const auto readRes = server.read(buf, sizeof(buf));
  EXPECT_EQ(readRes.want, TransportHint::None);
  EXPECT_EQ(std::string_view(buf, readRes.bytesProcessed), "ping");
}

TEST(TcpTransport, ReadWouldBlockHintsReadReady) {
  auto [lhs, rhs] = test::MakeSocketPair();
  TcpTransport transport(std::move(lhs));
  char buf[8];
  const auto res = transport.read(buf, sizeof(buf));
  EXPECT_EQ(res.bytesProcessed, 0U);
  EXPECT_EQ(res.want, TransportHint::ReadReady);
}

TEST(TcpTransport, WriteWouldBlockHintsWriteReadyWithPartialProgress) {
  auto [lhs, rhs] = test::MakeSocketPair();
  TcpTransport transport(std::move(lhs));
  const std::string big(8UL * 1024 * 1024, 'x');
  const auto res = transport.write(big);
  EXPECT_LT(res.bytesProcessed, big.size());
  EXPECT_EQ(res.want, TransportHint::WriteReady);
}

TEST(TcpTransport, ShutdownIsSeenAsEofByPeer) {
  auto [lhs, rhs] = test::MakeSocketPair();
  TcpTransport client(std::move(lhs));
  TcpTransport server(std::move(rhs));

  EXPECT_EQ(client.flush(), TransportHint::None);
  EXPECT_EQ(client.shutdown(), TransportHint::None);

  char buf[8];
  const auto res = server.read(buf, sizeof(buf));
  EXPECT_EQ(res.bytesProcessed, 0U);
  EXPECT_EQ(res.want, TransportHint::None);
}

}  // namespace tlsdial
