#include "tlsdial/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <utility>

namespace tlsdial {

namespace {
bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }
}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd baseFd;
  EXPECT_FALSE(baseFd);
  EXPECT_EQ(baseFd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, ClosesOnDestruction) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  { BaseFd readEnd(fds[0]); }
  EXPECT_FALSE(IsOpen(fds[0]));
  BaseFd writeEnd(fds[1]);
  EXPECT_TRUE(IsOpen(fds[1]));
}

TEST(BaseFd, MoveTransfersOwnership) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd first(fds[0]);
  BaseFd writeEnd(fds[1]);
  BaseFd second(std::move(first));
  EXPECT_FALSE(first);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(second.fd(), fds[0]);

  BaseFd third;
  third = std::move(second);
  EXPECT_EQ(third.fd(), fds[0]);
  EXPECT_TRUE(IsOpen(fds[0]));
}

TEST(BaseFd, ReleaseDoesNotClose) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd writeEnd(fds[1]);
  int raw;
  {
    BaseFd baseFd(fds[0]);
    raw = baseFd.release();
  }
  EXPECT_TRUE(IsOpen(raw));
  BaseFd cleanup(raw);
}

TEST(BaseFd, CloseIsIdempotent) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd writeEnd(fds[1]);
  BaseFd baseFd(fds[0]);
  baseFd.close();
  baseFd.close();
  EXPECT_FALSE(baseFd);
}

TEST(BaseFd, FailedCloseStillReleasesOwnership) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd writeEnd(fds[1]);
  ASSERT_EQ(::close(fds[0]), 0);
  BaseFd stale(fds[0]);
  stale.close();
  EXPECT_FALSE(stale);
  EXPECT_EQ(stale.fd(), BaseFd::kClosedFd);
}

}  // namespace tlsdial
