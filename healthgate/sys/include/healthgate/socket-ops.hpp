#pragma once

#include <cstdint>
#include <string_view>

namespace healthgate {

// Socket calls made on connection descriptors by the server loop and by close() from other threads.
// All of them report failures through their return value with errno set.

bool SetTcpNoDelay(int fd) noexcept;

// send() with MSG_NOSIGNAL, a peer gone away yields EPIPE instead of SIGPIPE.
int64_t SafeSend(int fd, std::string_view data) noexcept;

// Shuts both directions down. On a listening socket this also refuses new connections right away.
bool ShutdownReadWrite(int fd) noexcept;

}  // namespace healthgate
