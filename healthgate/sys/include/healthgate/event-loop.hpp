#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>
#include <vector>

#include "healthgate/base-fd.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate {

// Readiness bits, equal to their EPOLL* counterparts.
using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = EPOLLIN;
inline constexpr EventBmp EventOut = EPOLLOUT;
inline constexpr EventBmp EventErr = EPOLLERR;
inline constexpr EventBmp EventHup = EPOLLHUP;
inline constexpr EventBmp EventRdHup = EPOLLRDHUP;

// epoll instance polled by the server thread.
// The ready list grows (doubling) whenever a poll fills it completely, so that a burst is fully drained in a few
// iterations. It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  // Throws std::system_error if epoll cannot be created. A zero capacity is promoted to one.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Returns false on failure (logged, errno preserved).
  [[nodiscard]] bool add(EventFd event) const;

  // Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  void del(int fd) const;

  // Waits for at most the poll timeout.
  // The returned span stays valid until the next poll:
  //  - ready events, possibly none on timeout or EINTR (data() is then non null)
  //  - an empty span with a null data() on unrecoverable epoll_wait failure (logged)
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

 private:
  [[nodiscard]] bool control(int op, EventFd event) const;

  BaseFd _epollFd;
  int _pollTimeoutMs;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _ready;
};

}  // namespace healthgate
