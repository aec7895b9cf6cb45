#pragma once

#include <cstdint>

#include "healthgate/base-fd.hpp"

namespace healthgate {

// Non-blocking eventfd through which other threads interrupt the server poll.
class WakeupFd {
 public:
  // Throws std::system_error if the eventfd cannot be created.
  WakeupFd();

  // Makes the fd readable until the next drain(). Never blocks, safe from any thread.
  void notify() const noexcept;

  // Consumes pending notifications, returns how many were pending (0 if none).
  uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace healthgate
