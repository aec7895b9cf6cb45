#include "healthgate/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

#include "healthgate/errno-throw.hpp"
#include "healthgate/log.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate {

namespace {

std::string_view OpName(int op) {
  switch (op) {
    case EPOLL_CTL_ADD:
      return "ADD";
    case EPOLL_CTL_MOD:
      return "MOD";
    default:
      return "DEL";
  }
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _epollFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pollTimeoutMs(static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(pollTimeout).count())),
      _epollEvents(std::max(initialCapacity, 1U)),
      _ready(_epollEvents.size()) {
  if (!_epollFd) {
    throw_errno("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened, polling every {} ms", _epollFd.fd(), _pollTimeoutMs);
}

bool EventLoop::control(int op, EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_epollFd.fd(), op, event.fd, &ev) == 0) [[likely]] {
    return true;
  }
  const auto err = errno;
  // ENOENT on MOD means the connection was released in the meantime.
  if (op == EPOLL_CTL_MOD && (err == ENOENT || err == EBADF)) {
    log::warn("epoll_ctl {} on released fd # {}: {}", OpName(op), event.fd, std::strerror(err));
  } else {
    log::error("epoll_ctl {} failed for fd # {} (events=0x{:x}): {}", OpName(op), event.fd, event.eventBmp,
               std::strerror(err));
  }
  errno = err;
  return false;
}

void EventLoop::addOrThrow(EventFd event) const {
  if (!control(EPOLL_CTL_ADD, event)) {
    throw_errno("Unable to watch fd # {}", event.fd);
  }
}

bool EventLoop::add(EventFd event) const { return control(EPOLL_CTL_ADD, event); }

bool EventLoop::mod(EventFd event) const { return control(EPOLL_CTL_MOD, event); }

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_epollFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    log::debug("epoll_ctl DEL failed for fd # {}: {}", fd, std::strerror(errno));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  const int nbReady =
      ::epoll_wait(_epollFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);
  if (nbReady < 0) {
    if (errno == EINTR) {
      return {_ready.data(), 0};
    }
    log::error("epoll_wait failed on fd # {}: {}", _epollFd.fd(), std::strerror(errno));
    return {};
  }

  const auto nbEvents = static_cast<std::size_t>(nbReady);
  if (nbEvents == _epollEvents.size()) {
    log::debug("EventLoop saturated with {} events, doubling its capacity", nbEvents);
    _epollEvents.resize(2 * nbEvents);
    _ready.resize(2 * nbEvents);
  }
  std::transform(_epollEvents.begin(), _epollEvents.begin() + nbReady, _ready.begin(),
                 [](const epoll_event& ev) { return EventFd{ev.data.fd, ev.events}; });
  return {_ready.data(), nbEvents};
}

}  // namespace healthgate
