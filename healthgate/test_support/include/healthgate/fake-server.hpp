#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>

#include "healthgate/deadline.hpp"
#include "healthgate/http-handler.hpp"
#include "healthgate/server.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate::test {

// Scriptable Server recording the calls it receives.
//
// Default behavior:
//  - listenAndServe() blocks until shutdown() or close() is called, then returns ServerErrc::ServerClosed
//  - shutdown() succeeds immediately
//  - close() succeeds immediately
class FakeServer final : public Server {
 public:
  // listenAndServe() returns 'err' immediately instead of blocking.
  void failListenWith(std::error_code err);

  // shutdown() keeps waiting for in-flight work until its deadline fires, and returns the deadline error.
  void blockShutdown();

  // shutdown() returns 'err' immediately. The listen loop is released only if 'err' is empty.
  void setShutdownResult(std::error_code err);

  void setCloseResult(std::error_code err);

  [[nodiscard]] std::shared_ptr<HttpHandler> handler() const override;

  void setHandler(std::shared_ptr<HttpHandler> handler) override;

  std::error_code listenAndServe() override;

  std::error_code shutdown(const Deadline& deadline) override;

  std::error_code close() override;

  // Blocks until listenAndServe() has been entered, or 'timeout' elapses.
  bool waitListening(SteadyDuration timeout);

  [[nodiscard]] uint32_t nbListenCalls() const;
  [[nodiscard]] uint32_t nbShutdownCalls() const;
  [[nodiscard]] uint32_t nbCloseCalls() const;
  [[nodiscard]] uint32_t nbSetHandlerCalls() const;

  [[nodiscard]] std::optional<SteadyTimePoint> shutdownCalledAt() const;
  [[nodiscard]] std::optional<SteadyTimePoint> closeCalledAt() const;
  [[nodiscard]] std::optional<Deadline> lastShutdownDeadline() const;

 private:
  mutable std::mutex _mutex;
  std::condition_variable_any _cv;
  std::shared_ptr<HttpHandler> _handler;

  std::optional<std::error_code> _listenFailure;
  std::optional<std::error_code> _shutdownResult;
  std::error_code _closeResult;
  bool _blockShutdown{false};

  bool _stopped{false};

  uint32_t _nbListenCalls{};
  uint32_t _nbShutdownCalls{};
  uint32_t _nbCloseCalls{};
  uint32_t _nbSetHandlerCalls{};
  std::optional<SteadyTimePoint> _shutdownCalledAt;
  std::optional<SteadyTimePoint> _closeCalledAt;
  std::optional<Deadline> _lastShutdownDeadline;
};

}  // namespace healthgate::test
