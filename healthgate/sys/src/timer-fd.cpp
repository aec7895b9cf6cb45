#include "healthgate/timer-fd.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>

#include "healthgate/errno-throw.hpp"
#include "healthgate/log.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate {

TimerFd::TimerFd() : _baseFd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("timerfd creation failed");
  }
}

void TimerFd::arm(SysDuration period) const {
  itimerspec spec{};
  if (period > SysDuration::zero()) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(period);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(period - secs);
    spec.it_interval.tv_sec = static_cast<time_t>(secs.count());
    spec.it_interval.tv_nsec = static_cast<long>(nanos.count());
    spec.it_value = spec.it_interval;
  }
  if (::timerfd_settime(fd(), 0, &spec, nullptr) != 0) {
    const int timerFd = fd();
    throw_errno("timerfd_settime failed for fd # {}", timerFd);
  }
  log::trace("Timer fd # {} {}", fd(), period > SysDuration::zero() ? "armed" : "disarmed");
}

uint64_t TimerFd::drain() const noexcept {
  uint64_t expirations = 0;
  if (::read(fd(), &expirations, sizeof(expirations)) != static_cast<ssize_t>(sizeof(expirations))) {
    if (errno != EAGAIN) {
      log::error("Read of timer fd # {} failed: {}", fd(), std::strerror(errno));
    }
    return 0;
  }
  return expirations;
}

}  // namespace healthgate
