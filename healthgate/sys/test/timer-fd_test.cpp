#include "healthgate/timer-fd.hpp"

#include <gtest/gtest.h>
#include <poll.h>

#include <chrono>

namespace healthgate {

using namespace std::chrono_literals;

namespace {
bool FiresWithin(const TimerFd& timer, int timeoutMs) {
  pollfd pfd{timer.fd(), POLLIN, 0};
  return ::poll(&pfd, 1, timeoutMs) == 1;
}
}  // namespace

TEST(TimerFd, DisarmedAtCreation) {
  TimerFd timer;
  EXPECT_FALSE(FiresWithin(timer, 30));
  EXPECT_EQ(timer.drain(), 0U);
}

TEST(TimerFd, PeriodicExpirationsAreCounted) {
  TimerFd timer;
  timer.arm(5ms);
  ASSERT_TRUE(FiresWithin(timer, 1000));
  EXPECT_GE(timer.drain(), 1U);
}

TEST(TimerFd, DisarmStopsExpirations) {
  TimerFd timer;
  timer.arm(5ms);
  ASSERT_TRUE(FiresWithin(timer, 1000));
  timer.disarm();
  [[maybe_unused]] const auto expirations = timer.drain();
  EXPECT_FALSE(FiresWithin(timer, 30));
}

TEST(TimerFd, NonPositivePeriodDisarms) {
  TimerFd timer;
  timer.arm(-1ms);
  EXPECT_FALSE(FiresWithin(timer, 30));
}

}  // namespace healthgate
