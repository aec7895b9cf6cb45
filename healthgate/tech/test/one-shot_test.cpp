#include "healthgate/one-shot.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stop_token>
#include <thread>

#include "healthgate/deadline.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate {

using namespace std::chrono_literals;

TEST(OneShot, EmptyByDefault) {
  OneShot<int> slot;
  EXPECT_FALSE(slot.hasValue());
  EXPECT_FALSE(slot.written());
  EXPECT_FALSE(slot.tryTake().has_value());
}

TEST(OneShot, WrittenAtMostOnce) {
  OneShot<int> slot;
  EXPECT_TRUE(slot.set(1));
  EXPECT_FALSE(slot.set(2));
  EXPECT_EQ(slot.tryTake(), 1);
  // Taking the value does not reopen the slot.
  EXPECT_FALSE(slot.set(3));
  EXPECT_FALSE(slot.tryTake().has_value());
  EXPECT_TRUE(slot.written());
}

TEST(OneShot, TakeUntilReturnsPresentValueImmediately) {
  OneShot<int> slot;
  slot.set(42);
  EXPECT_EQ(slot.takeUntil(Deadline::After(10s)), 42);
  EXPECT_FALSE(slot.hasValue());
}

TEST(OneShot, TakeUntilTimesOut) {
  OneShot<int> slot;
  const auto start = SteadyClock::now();
  EXPECT_FALSE(slot.takeUntil(Deadline::After(50ms)).has_value());
  EXPECT_GE(SteadyClock::now() - start, 50ms);
}

TEST(OneShot, TakeUntilWakesUpOnSet) {
  OneShot<int> slot;
  std::jthread producer([&slot] {
    std::this_thread::sleep_for(20ms);
    slot.set(7);
  });
  const auto start = SteadyClock::now();
  EXPECT_EQ(slot.takeUntil(Deadline::After(10s)), 7);
  EXPECT_LT(SteadyClock::now() - start, 5s);
}

TEST(OneShot, TakeUntilWakesUpOnCancellation) {
  OneShot<int> slot;
  std::stop_source source;
  std::jthread canceller([&source] {
    std::this_thread::sleep_for(20ms);
    source.request_stop();
  });
  EXPECT_FALSE(slot.takeUntil(Deadline::Cancellable(source.get_token())).has_value());
  // A value written afterwards is still delivered.
  slot.set(3);
  EXPECT_EQ(slot.tryTake(), 3);
}

TEST(OneShot, WaitWrittenDoesNotConsume) {
  OneShot<int> slot;
  EXPECT_FALSE(slot.waitWritten(Deadline::After(10ms)));
  std::jthread producer([&slot] {
    std::this_thread::sleep_for(20ms);
    slot.set(5);
  });
  EXPECT_TRUE(slot.waitWritten(Deadline::After(10s)));
  EXPECT_EQ(slot.tryTake(), 5);
  // Still reported as written once taken.
  EXPECT_TRUE(slot.waitWritten(Deadline::After(0ms)));
}

}  // namespace healthgate
