#pragma once

#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <utility>

#include "healthgate/timedef.hpp"

namespace healthgate {

// A point in time after which a wait should give up, optionally paired with a stop token allowing the
// caller to cancel the wait earlier.
// A default constructed Deadline is unbounded and never cancelled.
class Deadline {
 public:
  Deadline() noexcept = default;

  static Deadline At(SteadyTimePoint timePoint, std::stop_token stopToken = {}) noexcept {
    return Deadline(timePoint, std::move(stopToken));
  }

  static Deadline After(SteadyDuration duration, std::stop_token stopToken = {}) noexcept {
    return Deadline(SteadyClock::now() + duration, std::move(stopToken));
  }

  static Deadline Cancellable(std::stop_token stopToken) noexcept {
    return Deadline(SteadyTimePoint::max(), std::move(stopToken));
  }

  [[nodiscard]] bool bounded() const noexcept { return _timePoint != SteadyTimePoint::max(); }

  [[nodiscard]] SteadyTimePoint timePoint() const noexcept { return _timePoint; }

  [[nodiscard]] const std::stop_token& stopToken() const noexcept { return _stopToken; }

  [[nodiscard]] bool expired() const noexcept { return bounded() && SteadyClock::now() >= _timePoint; }

  [[nodiscard]] bool cancelled() const noexcept { return _stopToken.stop_requested(); }

  [[nodiscard]] bool done() const noexcept { return cancelled() || expired(); }

  // Returns ServerErrc::Canceled if the stop token was triggered, ServerErrc::DeadlineExceeded if the time point is
  // passed, and an empty error code otherwise. Cancellation takes precedence.
  [[nodiscard]] std::error_code err() const noexcept;

  // Returns a Deadline sharing the same stop token, whose time point is the earliest of this one and 'timePoint'.
  [[nodiscard]] Deadline earliest(SteadyTimePoint timePoint) const noexcept {
    return Deadline(timePoint < _timePoint ? timePoint : _timePoint, _stopToken);
  }

  // Blocks on 'cv' until 'pred' holds, the time point is reached or the stop token is triggered.
  // Returns the final value of 'pred'. 'lock' must be held on entry and is held on return.
  template <class Predicate>
  bool wait(std::condition_variable_any& cv, std::unique_lock<std::mutex>& lock, Predicate pred) const {
    if (bounded()) {
      return cv.wait_until(lock, _stopToken, _timePoint, std::move(pred));
    }
    return cv.wait(lock, _stopToken, std::move(pred));
  }

 private:
  Deadline(SteadyTimePoint timePoint, std::stop_token stopToken) noexcept
      : _timePoint(timePoint), _stopToken(std::move(stopToken)) {}

  SteadyTimePoint _timePoint{SteadyTimePoint::max()};
  std::stop_token _stopToken;
};

}  // namespace healthgate
