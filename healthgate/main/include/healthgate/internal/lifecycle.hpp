#pragma once

#include <atomic>
#include <cstdint>

#include "healthgate/wakeup-fd.hpp"

namespace healthgate::internal {

struct Lifecycle {
  //  Idle     -> the event loop is not running
  //  Running  -> connections are accepted and served
  //  Draining -> listener closed, in-flight requests complete, idle connections are released
  //  Stopping -> every connection is being torn down, the loop exits at its next iteration
  enum class State : uint8_t { Idle, Running, Draining, Stopping };

  void enterRunning() noexcept { state.store(State::Running, std::memory_order_relaxed); }

  // Running -> Draining. Returns the previous state.
  State exchangeDraining() noexcept {
    State expected = State::Running;
    state.compare_exchange_strong(expected, State::Draining, std::memory_order_relaxed);
    return expected;
  }

  // Running or Draining -> Stopping. Returns the previous state.
  State exchangeStopping() noexcept {
    State expected = state.load(std::memory_order_relaxed);
    while ((expected == State::Running || expected == State::Draining) &&
           !state.compare_exchange_weak(expected, State::Stopping, std::memory_order_relaxed)) {
    }
    return expected;
  }

  void reset() noexcept { state.store(State::Idle, std::memory_order_relaxed); }

  [[nodiscard]] bool isIdle() const noexcept { return state.load(std::memory_order_relaxed) == State::Idle; }
  [[nodiscard]] bool isRunning() const noexcept { return state.load(std::memory_order_relaxed) == State::Running; }
  [[nodiscard]] bool isDraining() const noexcept { return state.load(std::memory_order_relaxed) == State::Draining; }
  [[nodiscard]] bool isStopping() const noexcept { return state.load(std::memory_order_relaxed) == State::Stopping; }
  [[nodiscard]] bool acceptingConnections() const noexcept {
    return state.load(std::memory_order_relaxed) == State::Running;
  }

  // Wakeup fd (eventfd) used to interrupt epoll_wait promptly when shutdown() or close() is invoked from another
  // thread.
  WakeupFd wakeupFd;
  std::atomic<State> state{State::Idle};
};

}  // namespace healthgate::internal
