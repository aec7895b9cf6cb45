#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "healthgate/http-handler.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate::test {

// Handler simulating a slow request: serve() blocks until release() is called (or a safety timeout elapses), then
// answers 200 with body "done".
class GateHandler final : public HttpHandler {
 public:
  explicit GateHandler(SteadyDuration safetyTimeout = std::chrono::seconds{10}) noexcept
      : _safetyTimeout(safetyTimeout) {}

  HttpResponse serve(const HttpRequest& request) override;

  // Blocks until at least one request entered serve(), or 'timeout' elapses.
  bool waitEntered(SteadyDuration timeout);

  void release();

  [[nodiscard]] uint32_t nbEntered() const;

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  SteadyDuration _safetyTimeout;
  uint32_t _nbEntered{};
  bool _released{false};
};

}  // namespace healthgate::test
