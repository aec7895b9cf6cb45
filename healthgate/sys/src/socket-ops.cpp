#include "healthgate/socket-ops.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cstdint>
#include <string_view>

namespace healthgate {

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kOn = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kOn, sizeof(kOn)) == 0;
}

int64_t SafeSend(int fd, std::string_view data) noexcept {
  return static_cast<int64_t>(::send(fd, data.data(), data.size(), MSG_NOSIGNAL));
}

bool ShutdownReadWrite(int fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

}  // namespace healthgate
