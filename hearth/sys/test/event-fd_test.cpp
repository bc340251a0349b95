#include "hearth/event-fd.hpp"

#include <gtest/gtest.h>
#include <poll.h>

namespace hearth {

namespace {
bool IsReadable(int fd) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}
}  // namespace

TEST(EventFd, SendMakesItReadableAndReadDrains) {
  EventFd eventFd;
  EXPECT_FALSE(IsReadable(eventFd.fd()));
  eventFd.send();
  eventFd.send();
  EXPECT_TRUE(IsReadable(eventFd.fd()));
  eventFd.read();
  EXPECT_FALSE(IsReadable(eventFd.fd()));
  // Reading again when empty is harmless (EAGAIN is not an error)
  eventFd.read();
}

}  // namespace hearth
