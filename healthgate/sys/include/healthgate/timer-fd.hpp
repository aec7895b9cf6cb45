#pragma once

#include <cstdint>

#include "healthgate/base-fd.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate {

// Monotonic timerfd polled by the server loop to run periodic maintenance (idle connection sweeping).
// Created disarmed.
class TimerFd {
 public:
  // Throws std::system_error if the timerfd cannot be created.
  TimerFd();

  // Fires every 'period', first expiration one period from now. Throws std::system_error on failure.
  // A non-positive period disarms the timer.
  void arm(SysDuration period) const;

  void disarm() const { arm(SysDuration::zero()); }

  // Consumes expirations, returns their number (0 if the timer did not fire).
  uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace healthgate
