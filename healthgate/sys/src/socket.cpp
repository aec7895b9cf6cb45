#include "healthgate/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <stdexcept>

#include "healthgate/errno-throw.hpp"
#include "healthgate/log.hpp"
#include "healthgate/socket-ops.hpp"

namespace healthgate {

namespace {

int ToSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

void EnableOption(int fd, int level, int option, const char* optionName) {
  static constexpr int kOn = 1;
  if (::setsockopt(fd, level, option, &kOn, sizeof(kOn)) != 0) {
    throw_errno("Unable to set {} on fd # {}", optionName, fd);
  }
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
}

bool Socket::tryBind(const ListenOptions& options) const {
  const int sockFd = fd();
  EnableOption(sockFd, SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");
  if (options.reusePort) {
    EnableOption(sockFd, SOL_SOCKET, SO_REUSEPORT, "SO_REUSEPORT");
  }
  if (options.tcpNoDelay && !SetTcpNoDelay(sockFd)) {
    throw_errno("Unable to set TCP_NODELAY on fd # {}", sockFd);
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(options.port);
  return ::bind(sockFd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

uint16_t Socket::bindAndListen(const ListenOptions& options) {
  const int sockFd = fd();
  if (!tryBind(options)) {
    throw_errno("Unable to bind fd # {} to port {}", sockFd, options.port);
  }
  if (::listen(sockFd, options.backlog) != 0) {
    throw_errno("Unable to listen on fd # {}", sockFd);
  }
  const uint16_t port = localPort();
  log::debug("Socket fd # {} listening on port {}", sockFd, port);
  return port;
}

uint16_t Socket::localPort() const {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    const int sockFd = fd();
    throw_errno("getsockname failed on fd # {}", sockFd);
  }
  return ntohs(addr.sin_port);
}

}  // namespace healthgate
