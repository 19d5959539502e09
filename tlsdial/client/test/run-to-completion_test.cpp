#include "tlsdial/run-to-completion.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <system_error>
#include <utility>

#include "tlsdial/base-fd.hpp"
#include "tlsdial/event-loop.hpp"
#include "tlsdial/poll-result.hpp"
#include "tlsdial/test-sockets.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

namespace {

using namespace std::chrono_literals;

// Ready once a byte can be read from fd.
struct ReadOneByte {
  PollResult<char> poll() {
    ++nbPolls;
    char ch;
    const auto res = transport.read(&ch, 1);
    if (res.bytesProcessed == 1) {
      return PollResult<char>::Ready(ch);
    }
    return PollResult<char>::NotReady(TransportHint::ReadReady);
  }

  [[nodiscard]] int fd() const noexcept { return descriptor; }

  TcpTransport& transport;
  int descriptor;
  int nbPolls{0};
};

}  // namespace

TEST(RunToCompletionTest, ReadyAfterReadiness) {
  auto [lhs, rhs] = test::MakeSocketPair();
  const int fd = lhs.fd();
  TcpTransport reader(std::move(lhs));
  TcpTransport writer(std::move(rhs));
  EXPECT_EQ(writer.write("x").bytesProcessed, 1U);

  EventLoop eventLoop(1s);
  ReadOneByte op{reader, fd};
  auto res = RunToCompletion(op, eventLoop);
  ASSERT_TRUE(res.isReady());
  EXPECT_EQ(res.value(), 'x');
  EXPECT_EQ(op.nbPolls, 1);
}

TEST(RunToCompletionTest, TimeoutIsReportedAsConnectError) {
  auto [lhs, rhs] = test::MakeSocketPair();
  const int fd = lhs.fd();
  TcpTransport reader(std::move(lhs));

  EventLoop eventLoop(20ms);
  ReadOneByte op{reader, fd};
  auto res = RunToCompletion(op, eventLoop);
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().code(), std::errc::timed_out);
  EXPECT_EQ(op.nbPolls, 1);

  // the operation can be resumed later
  TcpTransport writer(std::move(rhs));
  EXPECT_EQ(writer.write("y").bytesProcessed, 1U);
  auto again = RunToCompletion(op, eventLoop);
  ASSERT_TRUE(again.isReady());
  EXPECT_EQ(again.value(), 'y');
}

TEST(RunToCompletionTest, PendingWithoutDescriptorFails) {
  TcpTransport reader(BaseFd{});
  EventLoop eventLoop(20ms);
  ReadOneByte op{reader, -1};
  auto res = RunToCompletion(op, eventLoop);
  ASSERT_TRUE(res.isFailed());
  EXPECT_EQ(res.error().code(), std::errc::bad_file_descriptor);
}

}  // namespace tlsdial
