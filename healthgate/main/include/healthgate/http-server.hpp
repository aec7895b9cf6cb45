#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <system_error>
#include <unordered_map>

#include "healthgate/deadline.hpp"
#include "healthgate/event-loop.hpp"
#include "healthgate/http-codec.hpp"
#include "healthgate/http-handler.hpp"
#include "healthgate/http-request.hpp"
#include "healthgate/http-server-config.hpp"
#include "healthgate/internal/connection-state.hpp"
#include "healthgate/internal/lifecycle.hpp"
#include "healthgate/server.hpp"
#include "healthgate/socket.hpp"
#include "healthgate/timer-fd.hpp"

namespace healthgate {

// Single threaded HTTP/1.1 server built on epoll.
//
// The thread calling listenAndServe() runs the event loop: it accepts connections, parses requests and calls the
// handler synchronously. shutdown() and close() may be called from any other thread, they wake the loop up through
// an eventfd.
//
// Lifecycle:
//  - listen() binds the listening socket eagerly, so that port() is known before serving. Otherwise listenAndServe()
//    binds it itself and reports bind failures as its return value.
//  - shutdown() stops accepting immediately, closes idle connections and lets in-flight requests complete with
//    'Connection: close'. It returns once no connection is left.
//  - close() shuts down the listener and every connection socket from the calling thread, without waiting.
//  - once shutdown() or close() has been called, the server cannot be restarted and listenAndServe() returns
//    ServerErrc::ServerClosed.
class HttpServer final : public Server {
 public:
  // Construct a server with given configuration and handler. Does not bind any socket.
  // Throws std::invalid_argument if the configuration is invalid, std::system_error if the kernel refuses to create
  // the epoll, eventfd or timerfd descriptors.
  explicit HttpServer(HttpServerConfig config = {}, std::shared_ptr<HttpHandler> handler = nullptr);

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  // Closes the server and waits for the event loop to exit if it is running in another thread.
  ~HttpServer() override;

  [[nodiscard]] std::shared_ptr<HttpHandler> handler() const override;

  // Throws std::logic_error if the event loop is running.
  void setHandler(std::shared_ptr<HttpHandler> handler) override;

  // Binds and listens on the configured port if not already done.
  // Throws std::system_error on failure, std::logic_error if the server was already shut down or closed.
  void listen();

  std::error_code listenAndServe() override;

  std::error_code shutdown(const Deadline& deadline) override;

  std::error_code close() override;

  // The effective bound port, 0 if not bound yet.
  [[nodiscard]] uint16_t port() const;

  [[nodiscard]] bool isRunning() const noexcept { return _lifecycle.isRunning(); }

  [[nodiscard]] bool isDraining() const noexcept { return _lifecycle.isDraining(); }

  [[nodiscard]] std::size_t nbConnections() const;

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

 private:
  using ConnectionMap = std::unordered_map<int, std::unique_ptr<internal::ConnectionState>>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void initListener();
  void eventLoop();
  [[nodiscard]] bool shouldExitLoop() const;

  void acceptNewConnections();
  void sweepIdleConnections();
  void closeIdleConnections();

  void handleReadableClient(int fd);
  void handleWritableClient(int fd);

  // Both return false if the connection was closed.
  bool processRequests(ConnectionMapIt cnxIt);
  bool flushOutbound(ConnectionMapIt cnxIt);

  HttpResponse dispatch(const HttpRequest& request);

  ConnectionMapIt closeConnection(ConnectionMapIt cnxIt);
  void closeListener() noexcept;
  void closeAllConnections();

  HttpServerConfig _config;
  HttpRequestParser _parser;
  std::shared_ptr<HttpHandler> _handler;

  Socket _listenSocket;
  TimerFd _maintenanceTimer;
  EventLoop _eventLoop;

  internal::Lifecycle _lifecycle;

  // Guards the listening socket and the structure of the connection map against concurrent close() calls, and the
  // loop flags below.
  mutable std::mutex _mutex;
  std::condition_variable_any _loopExitCv;
  ConnectionMap _connections;
  bool _loopRunning{false};
  bool _listenerShut{false};
  bool _closeRequested{false};

  std::error_code _loopError;
  HttpRequest _request;
};

}  // namespace healthgate
