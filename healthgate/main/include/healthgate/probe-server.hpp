#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
#include <system_error>
#include <thread>

#include "healthgate/deadline.hpp"
#include "healthgate/http-handler.hpp"
#include "healthgate/one-shot.hpp"
#include "healthgate/probe-server-config.hpp"
#include "healthgate/server.hpp"

namespace healthgate {

// Handle over a Server augmented with readiness and liveness probes, coordinating its graceful shutdown.
//
// Typical use:
//   auto server = WrapServer(std::make_shared<HttpServer>(config, appHandler));
//   server->listenAndServe();            // returns immediately, serves from a background thread
//   ...                                  // wait for a termination signal
//   auto err = server->shutdown();       // 503 on readiness, grace period, graceful close, forced close
//
// The wrapped server must not be reconfigured once listenAndServe() has been called.
class ProbeServer {
 public:
  enum class Phase : uint8_t {
    Idle,               // not started
    Serving,            // listen task running, both probes answer 200
    DrainingAnnounced,  // readiness flipped to 503
    DrainingGrace,      // waiting for the grace period, the caller's deadline or the listen outcome
    Closing,            // graceful close of the wrapped server in progress
    Closed,             // shutdown sequence done
    FailedToStart,      // the listen task ended before shutdown could drain it
  };

  ProbeServer(const ProbeServer&) = delete;
  ProbeServer(ProbeServer&&) = delete;
  ProbeServer& operator=(const ProbeServer&) = delete;
  ProbeServer& operator=(ProbeServer&&) = delete;

  // Force-closes the wrapped server if nothing stopped it yet, then waits for the listen task. The wait is bounded by
  // the shutdown timeout, or by a short delay when a forced close already happened. A listen task still stuck in a
  // handler after that is detached: it owns the server and its result slot, not this object.
  ~ProbeServer();

  // Installs the health routes in front of the server handler and starts listening in a background thread.
  // The terminal result of the listen task is kept until shutdown() reads it.
  // Throws std::logic_error if called more than once.
  void listenAndServe();

  // Runs the shutdown sequence:
  //  1. if the listen task already ended, returns its result right away
  //  2. flips the readiness handler to not ready if it implements SettableReadiness
  //  3. waits for the first of the grace period, 'deadline' and the listen task result. The latter is returned as is
  //  4. gracefully shuts the server down, bounded by the configured shutdown timeout counted from now
  //  5. if the bound is exceeded, force-closes the server and returns the outcome of the close
  // Returns an empty error code on success.
  std::error_code shutdown(const Deadline& deadline = {});

  [[nodiscard]] Phase phase() const noexcept { return _phase.load(std::memory_order_acquire); }

  // True once the listen task has ended, whether its result was consumed or not.
  [[nodiscard]] bool listenFinished() const { return _listenResult->written(); }

  [[nodiscard]] const ProbeServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] const std::shared_ptr<HttpHandler>& readinessHandler() const noexcept {
    return _config.readyHandler;
  }

  [[nodiscard]] const std::shared_ptr<HttpHandler>& livenessHandler() const noexcept {
    return _config.aliveHandler;
  }

  [[nodiscard]] const std::shared_ptr<Server>& server() const noexcept { return _server; }

 private:
  friend std::unique_ptr<ProbeServer> WrapServer(std::shared_ptr<Server> server, ProbeServerConfig config);

  ProbeServer(std::shared_ptr<Server> server, ProbeServerConfig config);

  void setPhase(Phase phase) noexcept;

  std::error_code closeServer(std::error_code gracefulErr);

  std::shared_ptr<Server> _server;
  ProbeServerConfig _config;
  // Shared with the listen task, which may outlive this object.
  std::shared_ptr<OneShot<std::error_code>> _listenResult = std::make_shared<OneShot<std::error_code>>();
  std::atomic<Phase> _phase{Phase::Idle};
  // Set once the server was shut down gracefully or force-closed.
  std::atomic<bool> _serverStopped{false};
  std::atomic<bool> _forceClosed{false};
  std::jthread _listenThread;
};

// Wraps 'server' with health probes. Default probe handlers are created for the handlers left null in 'config', as
// two independent ReadinessHandler instances.
// Throws std::invalid_argument if 'server' is null or 'config' is invalid.
std::unique_ptr<ProbeServer> WrapServer(std::shared_ptr<Server> server, ProbeServerConfig config = {});

std::string_view PhaseToStr(ProbeServer::Phase phase) noexcept;

}  // namespace healthgate
