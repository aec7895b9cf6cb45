#pragma once

#include <sys/socket.h>

#include <cstdint>

#include "healthgate/base-fd.hpp"

namespace healthgate {

struct ListenOptions {
  uint16_t port{0};  // 0 lets the kernel pick an ephemeral port
  bool reusePort{false};
  bool tcpNoDelay{false};
  int backlog{SOMAXCONN};
};

// IPv4 TCP socket, listening on all interfaces once bound.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure, std::invalid_argument on an unknown type.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Applies the options (SO_REUSEADDR is always set) and binds. Returns false if bind fails, errno is kept.
  // Throws std::system_error if an option cannot be set.
  [[nodiscard]] bool tryBind(const ListenOptions& options) const;

  // Binds and listens, returns the bound port (the ephemeral one if options.port is 0).
  // Throws std::system_error on failure.
  uint16_t bindAndListen(const ListenOptions& options);

  // Port the socket is bound to, 0 if unbound.
  [[nodiscard]] uint16_t localPort() const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace healthgate
