#include "healthgate/fake-server.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>

#include "healthgate/deadline.hpp"
#include "healthgate/http-handler.hpp"
#include "healthgate/server-errc.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate::test {

void FakeServer::failListenWith(std::error_code err) {
  std::lock_guard<std::mutex> lock(_mutex);
  _listenFailure = err;
}

void FakeServer::blockShutdown() {
  std::lock_guard<std::mutex> lock(_mutex);
  _blockShutdown = true;
}

void FakeServer::setShutdownResult(std::error_code err) {
  std::lock_guard<std::mutex> lock(_mutex);
  _shutdownResult = err;
}

void FakeServer::setCloseResult(std::error_code err) {
  std::lock_guard<std::mutex> lock(_mutex);
  _closeResult = err;
}

std::shared_ptr<HttpHandler> FakeServer::handler() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _handler;
}

void FakeServer::setHandler(std::shared_ptr<HttpHandler> handler) {
  std::lock_guard<std::mutex> lock(_mutex);
  ++_nbSetHandlerCalls;
  _handler = std::move(handler);
}

std::error_code FakeServer::listenAndServe() {
  std::unique_lock<std::mutex> lock(_mutex);
  ++_nbListenCalls;
  _cv.notify_all();
  if (_listenFailure) {
    return *_listenFailure;
  }
  _cv.wait(lock, [this] { return _stopped; });
  return ServerErrc::ServerClosed;
}

std::error_code FakeServer::shutdown(const Deadline& deadline) {
  std::unique_lock<std::mutex> lock(_mutex);
  ++_nbShutdownCalls;
  _shutdownCalledAt = SteadyClock::now();
  _lastShutdownDeadline = deadline;
  if (_shutdownResult) {
    if (!*_shutdownResult) {
      _stopped = true;
      _cv.notify_all();
    }
    return *_shutdownResult;
  }
  if (_blockShutdown) {
    // In-flight work never completes by itself, only a concurrent close() ends it.
    if (!deadline.wait(_cv, lock, [this] { return _stopped; })) {
      return deadline.err();
    }
    return {};
  }
  _stopped = true;
  _cv.notify_all();
  return {};
}

std::error_code FakeServer::close() {
  std::lock_guard<std::mutex> lock(_mutex);
  ++_nbCloseCalls;
  _closeCalledAt = SteadyClock::now();
  _stopped = true;
  _cv.notify_all();
  return _closeResult;
}

bool FakeServer::waitListening(SteadyDuration timeout) {
  std::unique_lock<std::mutex> lock(_mutex);
  return _cv.wait_for(lock, timeout, [this] { return _nbListenCalls > 0; });
}

uint32_t FakeServer::nbListenCalls() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _nbListenCalls;
}

uint32_t FakeServer::nbShutdownCalls() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _nbShutdownCalls;
}

uint32_t FakeServer::nbCloseCalls() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _nbCloseCalls;
}

uint32_t FakeServer::nbSetHandlerCalls() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _nbSetHandlerCalls;
}

std::optional<SteadyTimePoint> FakeServer::shutdownCalledAt() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _shutdownCalledAt;
}

std::optional<SteadyTimePoint> FakeServer::closeCalledAt() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _closeCalledAt;
}

std::optional<Deadline> FakeServer::lastShutdownDeadline() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _lastShutdownDeadline;
}

}  // namespace healthgate::test
