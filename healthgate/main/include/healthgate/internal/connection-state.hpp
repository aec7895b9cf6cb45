#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "healthgate/base-fd.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate::internal {

struct ConnectionState {
  explicit ConnectionState(BaseFd&& fd) noexcept : baseFd(std::move(fd)) {}

  [[nodiscard]] int fd() const noexcept { return baseFd.fd(); }

  [[nodiscard]] bool hasPendingOutput() const noexcept { return outOffset < outBuffer.size(); }

  // A connection is idle when it holds neither a partial request nor unsent response bytes.
  [[nodiscard]] bool isIdle() const noexcept { return inBuffer.empty() && !hasPendingOutput(); }

  BaseFd baseFd;
  std::string inBuffer;
  std::string outBuffer;
  std::size_t outOffset{};
  SteadyTimePoint lastActivity{SteadyClock::now()};
  uint32_t nbRequestsServed{};
  // Set when the connection must be closed once the out buffer is flushed.
  bool closeAfterWrite{false};
  // Whether EPOLLOUT interest is currently registered.
  bool waitingWritable{false};
};

}  // namespace healthgate::internal
