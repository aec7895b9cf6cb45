#pragma once

namespace healthgate {

// Owner of a file descriptor, closed on destruction.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept {
    reset(other.release());
    return *this;
  }

  ~BaseFd() { reset(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership without closing.
  [[nodiscard]] int release() noexcept;

  // Closes the owned descriptor, if any, then takes ownership of 'fd'.
  void reset(int fd = kClosedFd) noexcept;

  // Closes now. Calling it on a closed BaseFd does nothing.
  void close() noexcept { reset(); }

 private:
  int _fd;
};

}  // namespace healthgate
