#pragma once

namespace healthgate {

// Optional capability of a handler whose answer can be switched between ready and not ready.
// Graceful shutdown flips it to not ready when the readiness handler implements it, and silently skips the step
// otherwise.
class SettableReadiness {
 public:
  SettableReadiness() = default;

  SettableReadiness(const SettableReadiness&) = delete;
  SettableReadiness(SettableReadiness&&) = delete;
  SettableReadiness& operator=(const SettableReadiness&) = delete;
  SettableReadiness& operator=(SettableReadiness&&) = delete;

  virtual ~SettableReadiness() = default;

  virtual void setReady(bool ready) = 0;
};

}  // namespace healthgate
