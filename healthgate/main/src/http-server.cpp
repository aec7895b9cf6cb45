#include "healthgate/http-server.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

#include "healthgate/base-fd.hpp"
#include "healthgate/deadline.hpp"
#include "healthgate/event-loop.hpp"
#include "healthgate/http-codec.hpp"
#include "healthgate/http-handler.hpp"
#include "healthgate/http-method.hpp"
#include "healthgate/http-response.hpp"
#include "healthgate/http-server-config.hpp"
#include "healthgate/http-status-code.hpp"
#include "healthgate/log.hpp"
#include "healthgate/server-errc.hpp"
#include "healthgate/socket-ops.hpp"
#include "healthgate/socket.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate {

namespace {

constexpr EventBmp kReadInterest = EventIn | EventRdHup;
constexpr EventBmp kReadWriteInterest = EventIn | EventOut | EventRdHup;

constexpr std::size_t kReadChunkSize = 4096;

const HttpServerConfig& ValidateConfig(const HttpServerConfig& config) {
  config.validate();
  return config;
}

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, std::shared_ptr<HttpHandler> handler)
    : _config(ValidateConfig(config)),
      _parser(_config.requestLimits),
      _handler(std::move(handler)),
      _eventLoop(_config.pollInterval) {
  _eventLoop.addOrThrow(EventLoop::EventFd{_lifecycle.wakeupFd.fd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_maintenanceTimer.fd(), EventIn});
}

HttpServer::~HttpServer() {
  [[maybe_unused]] const auto err = close();
  std::unique_lock<std::mutex> lock(_mutex);
  _loopExitCv.wait(lock, [this] { return !_loopRunning; });
}

std::shared_ptr<HttpHandler> HttpServer::handler() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _handler;
}

void HttpServer::setHandler(std::shared_ptr<HttpHandler> handler) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_loopRunning) {
    throw std::logic_error("Cannot set the handler of a running server");
  }
  _handler = std::move(handler);
}

void HttpServer::listen() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_closeRequested) {
    throw std::logic_error("Cannot listen on a closed server");
  }
  if (!_listenSocket) {
    initListener();
  }
}

void HttpServer::initListener() {
  Socket socket(Socket::Type::StreamNonBlock);
  _config.port = socket.bindAndListen(
      ListenOptions{.port = _config.port, .reusePort = _config.reusePort, .tcpNoDelay = _config.tcpNoDelay});
  _eventLoop.addOrThrow(EventLoop::EventFd{socket.fd(), EventIn});
  _listenSocket = std::move(socket);
  log::debug("Listening on port :{} (fd # {})", _config.port, _listenSocket.fd());
}

uint16_t HttpServer::port() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _listenSocket ? _config.port : uint16_t{0};
}

std::size_t HttpServer::nbConnections() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _connections.size();
}

namespace {

// Marks the loop as stopped and wakes up waiters on every exit path of listenAndServe, exceptions included.
class LoopRunningGuard {
 public:
  LoopRunningGuard(std::mutex& mutex, std::condition_variable_any& cv, bool& loopRunning) noexcept
      : _mutex(mutex), _cv(cv), _loopRunning(loopRunning) {}

  LoopRunningGuard(const LoopRunningGuard&) = delete;
  LoopRunningGuard(LoopRunningGuard&&) = delete;
  LoopRunningGuard& operator=(const LoopRunningGuard&) = delete;
  LoopRunningGuard& operator=(LoopRunningGuard&&) = delete;

  ~LoopRunningGuard() {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _loopRunning = false;
    }
    _cv.notify_all();
  }

 private:
  std::mutex& _mutex;
  std::condition_variable_any& _cv;
  bool& _loopRunning;
};

}  // namespace

std::error_code HttpServer::listenAndServe() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_closeRequested) {
      log::debug("listenAndServe called on a closed server");
      return ServerErrc::ServerClosed;
    }
    if (_loopRunning) {
      throw std::logic_error("Server is already running");
    }
    if (!_listenSocket) {
      try {
        initListener();
      } catch (const std::system_error& ex) {
        log::error("Unable to listen on port :{}: {}", _config.port, ex.what());
        return ex.code();
      }
    }
    _loopRunning = true;
    _lifecycle.enterRunning();
  }

  LoopRunningGuard loopGuard(_mutex, _loopExitCv, _loopRunning);

  _maintenanceTimer.arm(_config.pollInterval);

  log::info("Server running on port :{}", port());

  while (!shouldExitLoop()) {
    eventLoop();
  }

  closeAllConnections();
  closeListener();
  _maintenanceTimer.disarm();
  _lifecycle.reset();

  std::error_code err;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    // A loop ended by an unrecoverable poll error is not restartable either.
    _closeRequested = true;
    err = std::exchange(_loopError, {});
  }
  if (err) {
    log::error("Server stopped on error: {}", err.message());
    return err;
  }
  log::info("Server stopped");
  return ServerErrc::ServerClosed;
}

bool HttpServer::shouldExitLoop() const {
  if (_lifecycle.isStopping()) {
    return true;
  }
  return _lifecycle.isDraining() && _connections.empty();
}

void HttpServer::eventLoop() {
  const auto events = _eventLoop.poll();

  bool maintenanceTick = false;

  if (events.data() == nullptr) [[unlikely]] {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _loopError = std::make_error_code(std::errc::io_error);
    }
    _lifecycle.exchangeStopping();
    return;
  }

  for (const auto event : events) {
    const int fd = event.fd;
    if (_listenSocket && fd == _listenSocket.fd()) {
      if (_lifecycle.acceptingConnections()) {
        acceptNewConnections();
      }
    } else if (fd == _lifecycle.wakeupFd.fd()) {
      _lifecycle.wakeupFd.drain();
    } else if (fd == _maintenanceTimer.fd()) {
      maintenanceTick = _maintenanceTimer.drain() > 0;
    } else {
      const auto bmp = event.eventBmp;
      if ((bmp & EventOut) != 0) {
        handleWritableClient(fd);
      }
      // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN.
      // Treat them as a read trigger so we promptly observe EOF/errors and close.
      if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
        handleReadableClient(fd);
      }
    }
  }

  if (!_lifecycle.acceptingConnections()) {
    closeListener();
  }

  if (_lifecycle.isStopping()) {
    closeAllConnections();
    return;
  }
  if (_lifecycle.isDraining()) {
    closeIdleConnections();
  }
  if (maintenanceTick) {
    sweepIdleConnections();
  }
}

void HttpServer::acceptNewConnections() {
  while (true) {
    sockaddr_in inAddr{};
    socklen_t inLen = sizeof(inAddr);
    BaseFd cnxFd(
        ::accept4(_listenSocket.fd(), reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_NONBLOCK | SOCK_CLOEXEC));
    if (!cnxFd) {
      const auto savedErr = errno;
      if (savedErr == EINTR) {
        continue;
      }
      if (savedErr != EAGAIN && savedErr != EWOULDBLOCK) {
        log::error("Connection accept failed for socket fd # {}: {}", _listenSocket.fd(), std::strerror(savedErr));
      }
      // no more waiting connections
      break;
    }
    const int fd = cnxFd.fd();
    if (_config.tcpNoDelay && !SetTcpNoDelay(fd)) {
      log::warn("Unable to set TCP_NODELAY on fd # {}: {}", fd, std::strerror(errno));
    }
    if (!_eventLoop.add(EventLoop::EventFd{fd, kReadInterest})) {
      // already logged, the connection is released with cnxFd
      continue;
    }
    log::debug("Connection fd # {} opened", fd);
    std::lock_guard<std::mutex> lock(_mutex);
    _connections.emplace(fd, std::make_unique<internal::ConnectionState>(std::move(cnxFd)));
  }
}

void HttpServer::sweepIdleConnections() {
  if (_config.keepAliveTimeout.count() <= 0) {
    return;
  }
  const auto now = SteadyClock::now();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    const auto& state = *cnxIt->second;
    if (!state.hasPendingOutput() && now > state.lastActivity + _config.keepAliveTimeout) {
      log::debug("Closing connection fd # {} idle for more than {} ms", cnxIt->first,
                 _config.keepAliveTimeout.count());
      cnxIt = closeConnection(cnxIt);
      continue;
    }
    ++cnxIt;
  }
}

void HttpServer::closeIdleConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    if (cnxIt->second->isIdle()) {
      cnxIt = closeConnection(cnxIt);
    } else {
      ++cnxIt;
    }
  }
}

void HttpServer::handleReadableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  auto& state = *cnxIt->second;
  // Stop reading once a whole request of maximum size could have been buffered, the parser will reject it.
  const std::size_t maxBuffered = _config.requestLimits.maxHeaderBytes + _config.requestLimits.maxBodyBytes + kReadChunkSize;
  bool peerClosed = false;
  while (state.inBuffer.size() < maxBuffered) {
    const auto oldSize = state.inBuffer.size();
    state.inBuffer.resize(oldSize + kReadChunkSize);
    const auto nbRead = ::read(fd, state.inBuffer.data() + oldSize, kReadChunkSize);
    if (nbRead > 0) {
      state.inBuffer.resize(oldSize + static_cast<std::size_t>(nbRead));
      continue;
    }
    state.inBuffer.resize(oldSize);
    if (nbRead == 0) {
      peerClosed = true;
      break;
    }
    const auto savedErr = errno;
    if (savedErr == EINTR) {
      continue;
    }
    if (savedErr != EAGAIN && savedErr != EWOULDBLOCK) {
      log::debug("Read error on fd # {}: {}", fd, std::strerror(savedErr));
      closeConnection(cnxIt);
      return;
    }
    break;
  }
  state.lastActivity = SteadyClock::now();

  if (!processRequests(cnxIt)) {
    return;
  }
  if (peerClosed) {
    if (state.hasPendingOutput()) {
      state.closeAfterWrite = true;
    } else {
      log::debug("Connection fd # {} closed by peer", fd);
      closeConnection(cnxIt);
    }
  }
}

void HttpServer::handleWritableClient(int fd) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  flushOutbound(cnxIt);
}

bool HttpServer::processRequests(ConnectionMapIt cnxIt) {
  auto& state = *cnxIt->second;
  while (!state.closeAfterWrite && !state.inBuffer.empty()) {
    const ParseResult result = _parser.parse(state.inBuffer, _request);
    if (result.kind == ParseResult::Kind::NeedMore) {
      break;
    }
    if (result.kind == ParseResult::Kind::Error) {
      log::debug("Invalid request on fd # {} ({}): answering {}", cnxIt->first, result.reason, result.status);
      HttpResponse resp(result.status, http::ReasonPhrase(result.status));
      state.outBuffer.append(resp.serialize(false, false, _config.serverName));
      state.inBuffer.clear();
      state.closeAfterWrite = true;
      break;
    }

    ++state.nbRequestsServed;
    const bool headOnly = _request.method() == http::Method::HEAD;

    // The request views point into inBuffer, which must stay untouched until the response is serialized.
    const HttpResponse resp = dispatch(_request);
    // Read after dispatch: a drain started while the handler was running must close this connection.
    const bool keepAlive = _config.enableKeepAlive && !_request.wantClose() &&
                           state.nbRequestsServed < _config.maxRequestsPerConnection &&
                           _lifecycle.acceptingConnections();
    state.outBuffer.append(resp.serialize(keepAlive, headOnly, _config.serverName));
    state.inBuffer.erase(0, result.consumed);
    if (!keepAlive) {
      state.closeAfterWrite = true;
    }
  }
  if (state.closeAfterWrite) {
    // Pipelined requests after a closing response are never answered.
    state.inBuffer.clear();
  }
  state.lastActivity = SteadyClock::now();
  return flushOutbound(cnxIt);
}

HttpResponse HttpServer::dispatch(const HttpRequest& request) {
  const auto handler = this->handler();
  if (!handler) {
    return NotFoundHandler()->serve(request);
  }
  try {
    return handler->serve(request);
  } catch (const std::exception& ex) {
    log::error("Handler for {} {} threw: {}", http::MethodToStr(request.method()), request.path(), ex.what());
  }
  return HttpResponse(http::StatusCodeInternalServerError, http::ReasonPhrase(http::StatusCodeInternalServerError));
}

bool HttpServer::flushOutbound(ConnectionMapIt cnxIt) {
  auto& state = *cnxIt->second;
  const int fd = cnxIt->first;
  while (state.hasPendingOutput()) {
    const std::string_view remaining = std::string_view(state.outBuffer).substr(state.outOffset);
    const auto nbSent = SafeSend(fd, remaining);
    if (nbSent > 0) {
      state.outOffset += static_cast<std::size_t>(nbSent);
      continue;
    }
    const auto savedErr = errno;
    if (nbSent < 0 && savedErr == EINTR) {
      continue;
    }
    if (nbSent < 0 && (savedErr == EAGAIN || savedErr == EWOULDBLOCK)) {
      if (!state.waitingWritable) {
        state.waitingWritable = _eventLoop.mod(EventLoop::EventFd{fd, kReadWriteInterest});
      }
      return true;
    }
    log::debug("Write error on fd # {}: {}", fd, std::strerror(savedErr));
    closeConnection(cnxIt);
    return false;
  }
  state.outBuffer.clear();
  state.outOffset = 0;
  if (state.waitingWritable) {
    state.waitingWritable = !_eventLoop.mod(EventLoop::EventFd{fd, kReadInterest});
  }
  if (state.closeAfterWrite) {
    closeConnection(cnxIt);
    return false;
  }
  return true;
}

HttpServer::ConnectionMapIt HttpServer::closeConnection(ConnectionMapIt cnxIt) {
  const int fd = cnxIt->first;
  _eventLoop.del(fd);
  log::debug("Connection fd # {} closed", fd);
  std::lock_guard<std::mutex> lock(_mutex);
  return _connections.erase(cnxIt);
}

void HttpServer::closeListener() noexcept {
  if (!_listenSocket) {
    return;
  }
  _eventLoop.del(_listenSocket.fd());
  std::lock_guard<std::mutex> lock(_mutex);
  log::debug("Closing listener fd # {}", _listenSocket.fd());
  _listenSocket.close();
}

void HttpServer::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

std::error_code HttpServer::shutdown(const Deadline& deadline) {
  std::unique_lock<std::mutex> lock(_mutex);
  _closeRequested = true;
  if (!_loopRunning) {
    // Nothing is in flight, release the listener bound by listen() if any.
    if (_listenSocket) {
      _eventLoop.del(_listenSocket.fd());
      _listenSocket.close();
    }
    return {};
  }
  if (_lifecycle.exchangeDraining() == internal::Lifecycle::State::Running) {
    log::info("Graceful shutdown requested, draining {} connection(s)", _connections.size());
  }
  if (_listenSocket && !_listenerShut) {
    // Stops the kernel from completing new connections right away, the loop releases the descriptor.
    if (!ShutdownReadWrite(_listenSocket.fd())) {
      log::debug("Listener shutdown on fd # {} failed: {}", _listenSocket.fd(), std::strerror(errno));
    }
    _listenerShut = true;
  }
  _lifecycle.wakeupFd.notify();

  if (!deadline.wait(_loopExitCv, lock, [this] { return !_loopRunning; })) {
    const auto err = deadline.err();
    log::warn("Graceful shutdown interrupted with {} connection(s) left: {}", _connections.size(), err.message());
    return err;
  }
  return {};
}

std::error_code HttpServer::close() {
  std::lock_guard<std::mutex> lock(_mutex);
  _closeRequested = true;
  if (!_loopRunning) {
    if (_listenSocket) {
      _eventLoop.del(_listenSocket.fd());
      _listenSocket.close();
    }
    return {};
  }
  if (_lifecycle.exchangeStopping() != internal::Lifecycle::State::Stopping) {
    log::info("Closing server with {} connection(s)", _connections.size());
  }
  std::error_code err;
  if (_listenSocket && !_listenerShut) {
    if (!ShutdownReadWrite(_listenSocket.fd()) && errno != ENOTCONN) {
      err = std::error_code(errno, std::system_category());
      log::error("Listener shutdown on fd # {} failed: {}", _listenSocket.fd(), err.message());
    }
    _listenerShut = true;
  }
  for (const auto& [fd, state] : _connections) {
    // The loop thread may be blocked in a handler, shutting the sockets down here unblocks the peers now.
    if (!ShutdownReadWrite(fd)) {
      log::debug("Shutdown of connection fd # {} failed: {}", fd, std::strerror(errno));
    }
  }
  _lifecycle.wakeupFd.notify();
  return err;
}

}  // namespace healthgate
