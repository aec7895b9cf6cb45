#include "healthgate/deadline.hpp"

#include <system_error>

#include "healthgate/server-errc.hpp"

namespace healthgate {

std::error_code Deadline::err() const noexcept {
  if (cancelled()) {
    return ServerErrc::Canceled;
  }
  if (expired()) {
    return ServerErrc::DeadlineExceeded;
  }
  return {};
}

}  // namespace healthgate
