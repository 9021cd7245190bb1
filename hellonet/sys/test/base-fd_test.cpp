#include "hellonet/base-fd.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <utility>

namespace hellonet {

namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }

}  // namespace

TEST(BaseFd, DefaultIsClosed) {
  BaseFd empty;
  EXPECT_FALSE(empty);
  EXPECT_EQ(empty.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, ReleaseMakesObjectClosedAndReturnsFd) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  ::close(fds[1]);

  ASSERT_TRUE(rd);
  const int raw = rd.release();
  EXPECT_FALSE(rd);
  EXPECT_EQ(raw, fds[0]);
  EXPECT_EQ(0, ::close(raw));
}

TEST(BaseFd, DestructorClosesFd) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  {
    BaseFd rd(fds[0]);
    BaseFd wr(fds[1]);
  }
  EXPECT_FALSE(IsOpen(fds[0]));
  EXPECT_FALSE(IsOpen(fds[1]));
}

TEST(BaseFd, MoveTransfersOwnership) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd wr(fds[1]);
  BaseFd rd(fds[0]);
  BaseFd moved(std::move(rd));
  EXPECT_FALSE(rd);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(moved.fd(), fds[0]);

  BaseFd assigned;
  assigned = std::move(moved);
  EXPECT_FALSE(moved);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(assigned.fd(), fds[0]);
  EXPECT_TRUE(IsOpen(fds[0]));
}

TEST(BaseFd, MoveAssignSelfNoOpLeavesFdIntact) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd wr(fds[1]);
  BaseFd fdOwner(fds[0]);
  auto& alias = fdOwner;
  fdOwner = std::move(alias);
  EXPECT_TRUE(fdOwner);
  EXPECT_TRUE(IsOpen(fds[0]));
}

TEST(BaseFd, CloseIsIdempotent) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd wr(fds[1]);
  BaseFd rd(fds[0]);
  rd.close();
  EXPECT_FALSE(rd);
  rd.close();
  EXPECT_FALSE(rd);
}

}  // namespace hellonet
