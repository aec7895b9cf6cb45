#pragma once

#include <memory>
#include <system_error>

#include "healthgate/deadline.hpp"
#include "healthgate/http-handler.hpp"

namespace healthgate {

// Contract of an HTTP server that can be wrapped with health probes and coordinated shutdown.
//
// listenAndServe() blocks the calling thread; shutdown() and close() are called from other threads while it runs.
// Outcomes are reported as std::error_code, ServerErrc::ServerClosed being the expected outcome of a listen loop
// ended by shutdown() or close().
class Server {
 public:
  Server() = default;

  Server(const Server&) = delete;
  Server(Server&&) = delete;
  Server& operator=(const Server&) = delete;
  Server& operator=(Server&&) = delete;

  virtual ~Server() = default;

  // The handler currently answering requests, possibly null.
  [[nodiscard]] virtual std::shared_ptr<HttpHandler> handler() const = 0;

  // Replaces the request handler. Must be called before listenAndServe().
  virtual void setHandler(std::shared_ptr<HttpHandler> handler) = 0;

  // Accepts and serves connections until shutdown() or close() is called.
  // Returns the start-up error if the server cannot listen, ServerErrc::ServerClosed otherwise.
  virtual std::error_code listenAndServe() = 0;

  // Stops accepting new connections and waits for in-flight requests to complete.
  // Returns an empty error code once all connections are released, ServerErrc::DeadlineExceeded if 'deadline' is
  // reached first and ServerErrc::Canceled if its stop token is triggered.
  virtual std::error_code shutdown(const Deadline& deadline) = 0;

  // Immediately closes the listener and all connections, without waiting.
  virtual std::error_code close() = 0;
};

}  // namespace healthgate
