#include "healthgate/probe-server.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "healthgate/deadline.hpp"
#include "healthgate/duration-format.hpp"
#include "healthgate/health-routes.hpp"
#include "healthgate/log.hpp"
#include "healthgate/probe-server-config.hpp"
#include "healthgate/readiness-handler.hpp"
#include "healthgate/server-errc.hpp"
#include "healthgate/server.hpp"
#include "healthgate/settable-readiness.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate {

namespace {

SteadyTimePoint SaturatingAdd(SteadyTimePoint timePoint, std::chrono::milliseconds duration) {
  const auto room = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyTimePoint::max() - timePoint);
  return duration >= room ? SteadyTimePoint::max() : timePoint + duration;
}

// A forced close shuts every connection down, so a listen task still running after this delay is stuck in a handler.
constexpr std::chrono::milliseconds kForcedCloseJoinBound{100};

ProbeServer::Phase PhaseForListenResult(std::error_code err) {
  return err == ServerErrc::ServerClosed ? ProbeServer::Phase::Closed : ProbeServer::Phase::FailedToStart;
}

}  // namespace

std::string_view PhaseToStr(ProbeServer::Phase phase) noexcept {
  switch (phase) {
    case ProbeServer::Phase::Idle:
      return "idle";
    case ProbeServer::Phase::Serving:
      return "serving";
    case ProbeServer::Phase::DrainingAnnounced:
      return "draining-announced";
    case ProbeServer::Phase::DrainingGrace:
      return "draining-grace";
    case ProbeServer::Phase::Closing:
      return "closing";
    case ProbeServer::Phase::Closed:
      return "closed";
    case ProbeServer::Phase::FailedToStart:
      return "failed-to-start";
    default:
      return "unknown";
  }
}

std::unique_ptr<ProbeServer> WrapServer(std::shared_ptr<Server> server, ProbeServerConfig config) {
  if (!server) {
    throw std::invalid_argument("Cannot wrap a null server");
  }
  config.validate();
  return std::unique_ptr<ProbeServer>(new ProbeServer(std::move(server), std::move(config)));
}

ProbeServer::ProbeServer(std::shared_ptr<Server> server, ProbeServerConfig config)
    : _server(std::move(server)), _config(std::move(config)) {
  // Readiness and liveness are independent flags, hence two distinct instances.
  if (!_config.readyHandler) {
    _config.readyHandler = std::make_shared<ReadinessHandler>();
  }
  if (!_config.aliveHandler) {
    _config.aliveHandler = std::make_shared<ReadinessHandler>();
  }
}

ProbeServer::~ProbeServer() {
  if (!_listenThread.joinable()) {
    return;
  }
  if (!_listenResult->written() && !_serverStopped.load(std::memory_order_acquire)) {
    log::warn("ProbeServer destroyed while serving, closing the server");
    if (const auto err = _server->close(); err) {
      log::error("Close of the server failed: {}", err.message());
    }
    _forceClosed.store(true, std::memory_order_release);
  }
  const std::chrono::milliseconds joinBound =
      _forceClosed.load(std::memory_order_acquire) ? kForcedCloseJoinBound
                                                   : std::max(_config.shutdownTimeout, kForcedCloseJoinBound);
  if (!_listenResult->waitWritten(Deadline::After(joinBound))) {
    log::error("Listen task still running {} after the server was stopped, detaching it", PrettyDuration{joinBound});
    _listenThread.detach();
  }
}

void ProbeServer::setPhase(Phase phase) noexcept {
  _phase.store(phase, std::memory_order_release);
  log::debug("ProbeServer phase: {}", PhaseToStr(phase));
}

void ProbeServer::listenAndServe() {
  if (_listenThread.joinable() || phase() != Phase::Idle) {
    throw std::logic_error("ProbeServer::listenAndServe can only be called once");
  }

  _server->setHandler(BindHealthRoutes(_config, _config.readyHandler, _config.aliveHandler, _server->handler()));
  setPhase(Phase::Serving);

  _listenThread = std::jthread([server = _server, result = _listenResult] {
    std::error_code err;
    try {
      err = server->listenAndServe();
    } catch (const std::system_error& ex) {
      log::error("Listen task failed: {}", ex.what());
      err = ex.code();
    } catch (const std::exception& ex) {
      log::error("Listen task failed: {}", ex.what());
      err = ServerErrc::ListenerFailure;
    }
    if (err != ServerErrc::ServerClosed) {
      log::error("Server stopped listening: {}", err.message());
    }
    result->set(err);
  });
}

std::error_code ProbeServer::shutdown(const Deadline& deadline) {
  if (auto result = _listenResult->tryTake()) {
    setPhase(PhaseForListenResult(*result));
    log::warn("Server is not serving, shutdown returns its listen outcome: {}", result->message());
    return *result;
  }

  if (auto* settable = dynamic_cast<SettableReadiness*>(_config.readyHandler.get()); settable != nullptr) {
    settable->setReady(false);
  } else {
    log::debug("Readiness handler does not support being set, not flipping it");
  }
  setPhase(Phase::DrainingAnnounced);
  log::info("Shutdown started, waiting {} before closing the server", PrettyDuration{_config.waitBeforeShutdown});

  setPhase(Phase::DrainingGrace);
  const Deadline graceDeadline = deadline.earliest(SaturatingAdd(SteadyClock::now(), _config.waitBeforeShutdown));
  if (auto result = _listenResult->takeUntil(graceDeadline)) {
    setPhase(PhaseForListenResult(*result));
    log::warn("Server stopped during the grace period: {}", result->message());
    return *result;
  }
  if (deadline.cancelled()) {
    log::info("Grace period interrupted by cancellation");
  } else if (deadline.expired()) {
    log::info("Grace period cut short by the shutdown deadline");
  }

  setPhase(Phase::Closing);
  const auto closingDeadline = Deadline::At(SaturatingAdd(SteadyClock::now(), _config.shutdownTimeout));
  return closeServer(_server->shutdown(closingDeadline));
}

std::error_code ProbeServer::closeServer(std::error_code gracefulErr) {
  if (!gracefulErr) {
    _serverStopped.store(true, std::memory_order_release);
    setPhase(Phase::Closed);
    log::info("Server shut down gracefully");
    return {};
  }
  if (gracefulErr != ServerErrc::DeadlineExceeded) {
    setPhase(Phase::Closed);
    log::error("Graceful shutdown failed: {}", gracefulErr.message());
    return gracefulErr;
  }

  log::warn("Graceful shutdown did not complete within {}, closing the server",
            PrettyDuration{_config.shutdownTimeout});
  const auto closeErr = _server->close();
  _forceClosed.store(true, std::memory_order_release);
  _serverStopped.store(true, std::memory_order_release);
  setPhase(Phase::Closed);
  if (closeErr) {
    log::error("Close of the server failed: {}", closeErr.message());
  }
  return closeErr;
}

}  // namespace healthgate
