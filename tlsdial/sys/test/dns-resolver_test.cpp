#include "tlsdial/dns-resolver.hpp"

#include <gtest/gtest.h>
#include <poll.h>
#include <sys/socket.h>

#include <memory>
#include <stdexcept>

namespace tlsdial {

namespace {

bool WaitDone(const DnsResolver::Request& request) {
  pollfd pfd{request.fd(), POLLIN, 0};
  return ::poll(&pfd, 1, 5000) == 1 && request.done();
}

}  // namespace

TEST(DnsResolver, RequiresAtLeastOneThread) { EXPECT_THROW(DnsResolver(0), std::invalid_argument); }

TEST(DnsResolver, ResolvesNumericHost) {
  DnsResolver resolver(2);
  EXPECT_EQ(resolver.nbThreads(), 2U);
  auto request = resolver.resolve("127.0.0.1", "443", AF_INET);
  ASSERT_TRUE(WaitDone(*request));
  EXPECT_EQ(request->result().gaiError, 0);
  EXPECT_NE(request->result().addresses, nullptr);
  EXPECT_EQ(request->host(), "127.0.0.1");
}

TEST(DnsResolver, ReportsResolutionFailure) {
  DnsResolver resolver(1);
  auto request = resolver.resolve("invalid host name with spaces", "80");
  ASSERT_TRUE(WaitDone(*request));
  EXPECT_NE(request->result().gaiError, 0);
  EXPECT_EQ(request->result().addresses, nullptr);
}

TEST(DnsResolver, AbandonedRequestsDoNotBlockOthers) {
  DnsResolver resolver(1);
  for (int requestPos = 0; requestPos < 8; ++requestPos) {
    (void)resolver.resolve("127.0.0.1", "80", AF_INET);
  }
  auto request = resolver.resolve("127.0.0.1", "81", AF_INET);
  ASSERT_TRUE(WaitDone(*request));
  EXPECT_EQ(request->result().gaiError, 0);
}

}  // namespace tlsdial
