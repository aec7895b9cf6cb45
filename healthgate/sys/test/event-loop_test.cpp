#include "healthgate/event-loop.hpp"

#include <gtest/gtest.h>
#include <sys/eventfd.h>

#include <chrono>
#include <cstdint>
#include <system_error>
#include <utility>
#include <vector>

#include "healthgate/base-fd.hpp"
#include "healthgate/wakeup-fd.hpp"

namespace healthgate {

using namespace std::chrono_literals;

TEST(EventLoop, PollTimesOutWithEmptySpan) {
  EventLoop loop(10ms);
  const auto events = loop.poll();
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);
}

TEST(EventLoop, ReportsReadyFd) {
  EventLoop loop(100ms);
  WakeupFd wakeup;
  loop.addOrThrow(EventLoop::EventFd{wakeup.fd(), EventIn});
  wakeup.notify();

  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, wakeup.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);

  [[maybe_unused]] const auto pending = wakeup.drain();
  loop.del(wakeup.fd());
  wakeup.notify();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, AddTwiceFails) {
  EventLoop loop(10ms);
  WakeupFd wakeup;
  EXPECT_TRUE(loop.add(EventLoop::EventFd{wakeup.fd(), EventIn}));
  EXPECT_FALSE(loop.add(EventLoop::EventFd{wakeup.fd(), EventIn}));
  EXPECT_THROW(loop.addOrThrow(EventLoop::EventFd{wakeup.fd(), EventIn}), std::system_error);
}

TEST(EventLoop, ModUnknownFdFails) {
  EventLoop loop(10ms);
  WakeupFd wakeup;
  EXPECT_FALSE(loop.mod(EventLoop::EventFd{wakeup.fd(), EventIn}));
  EXPECT_TRUE(loop.add(EventLoop::EventFd{wakeup.fd(), EventIn}));
  EXPECT_TRUE(loop.mod(EventLoop::EventFd{wakeup.fd(), EventIn | EventOut}));
}

TEST(EventLoop, GrowsWhenSaturated) {
  EventLoop loop(10ms, 2);
  EXPECT_EQ(loop.capacity(), 2U);
  std::vector<WakeupFd> fds(3);
  for (const auto& eventFd : fds) {
    loop.addOrThrow(EventLoop::EventFd{eventFd.fd(), EventIn});
    eventFd.notify();
  }
  EXPECT_EQ(loop.poll().size(), 2U);
  EXPECT_EQ(loop.capacity(), 4U);
  EXPECT_EQ(loop.poll().size(), 3U);
}

TEST(EventLoop, ZeroCapacityPromotedToOne) {
  EventLoop loop(10ms, 0);
  EXPECT_EQ(loop.capacity(), 1U);
}

TEST(EventLoop, MoveKeepsRegistrations) {
  EventLoop loop(100ms);
  WakeupFd wakeup;
  loop.addOrThrow(EventLoop::EventFd{wakeup.fd(), EventIn});
  EventLoop moved(std::move(loop));
  EXPECT_EQ(loop.capacity(), 0U);  // NOLINT(bugprone-use-after-move)
  wakeup.notify();
  EXPECT_EQ(moved.poll().size(), 1U);
}

}  // namespace healthgate
