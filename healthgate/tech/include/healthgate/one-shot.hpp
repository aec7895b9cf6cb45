#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

#include "healthgate/deadline.hpp"

namespace healthgate {

// Single-slot, single-write result channel between a producer thread and one consumer.
//  - the producer writes at most once in the lifetime of the object, later writes are refused
//  - the consumer may poll without blocking, or block until the value arrives or a Deadline fires
//  - a value is consumed by the first successful take
template <class T>
class OneShot {
 public:
  OneShot() = default;

  OneShot(const OneShot&) = delete;
  OneShot(OneShot&&) = delete;
  OneShot& operator=(const OneShot&) = delete;
  OneShot& operator=(OneShot&&) = delete;

  ~OneShot() = default;

  // Stores 'value' if nothing has ever been stored. Returns false if the slot was already written.
  bool set(T value) {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_written) {
        return false;
      }
      _written = true;
      _value.emplace(std::move(value));
    }
    _cv.notify_all();
    return true;
  }

  // Non-blocking take.
  [[nodiscard]] std::optional<T> tryTake() {
    std::lock_guard<std::mutex> lock(_mutex);
    return std::exchange(_value, std::nullopt);
  }

  // Blocks until the value is available or 'deadline' is done, then takes the value if present.
  [[nodiscard]] std::optional<T> takeUntil(const Deadline& deadline) {
    std::unique_lock<std::mutex> lock(_mutex);
    deadline.wait(_cv, lock, [this] { return _value.has_value(); });
    return std::exchange(_value, std::nullopt);
  }

  // Blocks until a value has been written, taken or not, or 'deadline' is done. Returns written().
  [[nodiscard]] bool waitWritten(const Deadline& deadline) {
    std::unique_lock<std::mutex> lock(_mutex);
    deadline.wait(_cv, lock, [this] { return _written; });
    return _written;
  }

  // True if a value is stored and not yet taken.
  [[nodiscard]] bool hasValue() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _value.has_value();
  }

  // True if a value was ever stored, taken or not.
  [[nodiscard]] bool written() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _written;
  }

 private:
  mutable std::mutex _mutex;
  std::condition_variable_any _cv;
  std::optional<T> _value;
  bool _written{false};
};

}  // namespace healthgate
