#pragma once

namespace healthgate {

// Process wide SIGINT / SIGTERM latch, polled by the owner of a ProbeServer to start its shutdown.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs the handlers. Throws std::system_error if sigaction fails.
  static void Enable();

  // Restores the default dispositions.
  static void Disable() noexcept;

  static bool IsStopRequested() noexcept { return StopSignal() != 0; }

  // Number of the last termination signal received, 0 if none.
  static int StopSignal() noexcept;

  static void ResetStopRequest() noexcept;
};

}  // namespace healthgate
