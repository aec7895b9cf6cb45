#include "healthgate/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <utility>

namespace healthgate {

namespace {
bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }
}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
  fd.close();
  EXPECT_FALSE(fd);
}

TEST(BaseFd, ClosesOnDestruction) {
  int rawFd;
  {
    BaseFd fd(::dup(STDOUT_FILENO));
    ASSERT_TRUE(fd);
    rawFd = fd.fd();
    EXPECT_TRUE(IsOpen(rawFd));
  }
  EXPECT_FALSE(IsOpen(rawFd));
}

TEST(BaseFd, MoveTransfersOwnership) {
  BaseFd first(::dup(STDOUT_FILENO));
  const int rawFd = first.fd();
  BaseFd second(std::move(first));
  EXPECT_FALSE(first);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(second.fd(), rawFd);

  BaseFd third;
  third = std::move(second);
  EXPECT_EQ(third.fd(), rawFd);
  EXPECT_TRUE(IsOpen(rawFd));
}

TEST(BaseFd, MoveAssignClosesPreviousFd) {
  BaseFd first(::dup(STDOUT_FILENO));
  BaseFd second(::dup(STDOUT_FILENO));
  const int previous = second.fd();
  second = std::move(first);
  EXPECT_FALSE(IsOpen(previous));
  EXPECT_TRUE(IsOpen(second.fd()));
}

TEST(BaseFd, ReleaseDoesNotClose) {
  BaseFd fd(::dup(STDOUT_FILENO));
  const int rawFd = fd.release();
  EXPECT_FALSE(fd);
  EXPECT_TRUE(IsOpen(rawFd));
  ::close(rawFd);
}

TEST(BaseFd, CloseIsIdempotent) {
  BaseFd fd(::dup(STDOUT_FILENO));
  fd.close();
  EXPECT_FALSE(fd);
  fd.close();
  EXPECT_FALSE(fd);
}

}  // namespace healthgate
