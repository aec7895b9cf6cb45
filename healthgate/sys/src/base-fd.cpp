#include "healthgate/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "healthgate/log.hpp"

namespace healthgate {

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::reset(int fd) noexcept {
  const int oldFd = std::exchange(_fd, fd);
  if (oldFd == kClosedFd || oldFd == fd) {
    return;
  }
  int ret;
  do {
    ret = ::close(oldFd);
  } while (ret != 0 && errno == EINTR);
  if (ret != 0) {
    log::error("Unable to close fd # {}: {}", oldFd, std::strerror(errno));
    return;
  }
  log::trace("fd # {} closed", oldFd);
}

}  // namespace healthgate
