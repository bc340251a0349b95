#include "hearth/event-loop.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <vector>

#include "hearth/base-fd.hpp"
#include "hearth/event-fd.hpp"
#include "hearth/event.hpp"

namespace hearth {

using namespace std::chrono_literals;

TEST(EventLoop, TimeoutReturnsEmptySpanWithValidData) {
  EventLoop loop(1ms);
  auto events = loop.poll();
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);
}

TEST(EventLoop, ReportsReadableFd) {
  EventLoop loop(100ms);
  EventFd eventFd;
  loop.addOrThrow(EventLoop::EventFd{eventFd.fd(), EventIn});
  eventFd.send();
  auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, eventFd.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);
}

TEST(EventLoop, AddTwiceFails) {
  EventLoop loop(1ms);
  EventFd eventFd;
  EXPECT_TRUE(loop.add(EventLoop::EventFd{eventFd.fd(), EventIn}));
  EXPECT_FALSE(loop.add(EventLoop::EventFd{eventFd.fd(), EventIn}));
}

TEST(EventLoop, ModUnknownFdFails) {
  EventLoop loop(1ms);
  EventFd eventFd;
  EXPECT_FALSE(loop.mod(EventLoop::EventFd{eventFd.fd(), EventIn}));
}

TEST(EventLoop, DelStopsReporting) {
  EventLoop loop(1ms);
  EventFd eventFd;
  loop.addOrThrow(EventLoop::EventFd{eventFd.fd(), EventIn});
  loop.del(eventFd.fd());
  eventFd.send();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, CapacityGrowsWhenSaturated) {
  EventLoop loop(10ms, 2);
  EXPECT_EQ(loop.capacity(), 2U);
  std::vector<EventFd> eventFds(4);
  for (const auto& eventFd : eventFds) {
    loop.addOrThrow(EventLoop::EventFd{eventFd.fd(), EventIn});
    eventFd.send();
  }
  auto events = loop.poll();
  EXPECT_EQ(events.size(), 2U);
  EXPECT_EQ(loop.capacity(), 4U);
  events = loop.poll();
  EXPECT_EQ(events.size(), 4U);
}

TEST(EventLoop, ZeroInitialCapacityIsPromoted) {
  EventLoop loop(1ms, 0);
  EXPECT_EQ(loop.capacity(), 1U);
}

}  // namespace hearth
