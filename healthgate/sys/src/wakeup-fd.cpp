#include "healthgate/wakeup-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "healthgate/errno-throw.hpp"
#include "healthgate/log.hpp"

namespace healthgate {

WakeupFd::WakeupFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("eventfd creation failed");
  }
}

void WakeupFd::notify() const noexcept {
  // EAGAIN means the counter is saturated, the fd is readable anyway.
  if (::eventfd_write(fd(), 1) != 0 && errno != EAGAIN) {
    log::error("Wakeup of fd # {} failed: {}", fd(), std::strerror(errno));
  }
}

uint64_t WakeupFd::drain() const noexcept {
  eventfd_t pending = 0;
  if (::eventfd_read(fd(), &pending) != 0) {
    if (errno != EAGAIN) {
      log::error("Drain of wakeup fd # {} failed: {}", fd(), std::strerror(errno));
    }
    return 0;
  }
  return pending;
}

}  // namespace healthgate
