#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace healthgate {

class HttpHandler;

// Options of a server wrapped with health probes and coordinated graceful shutdown.
// The configuration is copied when the server is wrapped and cannot be changed afterwards.
struct ProbeServerConfig {
  static constexpr std::string_view kDefaultReadyPath = "/ready";
  static constexpr std::string_view kDefaultAlivePath = "/health";

  // Path answering readiness probes. An empty path falls back to kDefaultReadyPath.
  std::string readyPath{kDefaultReadyPath};

  // Handler answering readiness probes. If null, a ReadinessHandler (200 until shutdown starts, 503 afterwards)
  // is created when the server is wrapped.
  // A custom handler is flipped to not ready at shutdown only if it implements SettableReadiness.
  std::shared_ptr<HttpHandler> readyHandler;

  // Path answering liveness probes. An empty path falls back to kDefaultAlivePath.
  std::string alivePath{kDefaultAlivePath};

  // Handler answering liveness probes. If null, a separate ReadinessHandler is created, which stays ready for the
  // whole lifetime of the server.
  std::shared_ptr<HttpHandler> aliveHandler;

  // Grace period between the readiness flip and the start of the graceful close, so that orchestrators probing the
  // readiness endpoint stop routing traffic before connections are drained. Default: 15 s.
  std::chrono::milliseconds waitBeforeShutdown{std::chrono::seconds{15}};

  // Upper bound of the graceful close phase. If in-flight requests are not done by then, connections are forcibly
  // closed. Default: 5 s.
  std::chrono::milliseconds shutdownTimeout{std::chrono::seconds{5}};

  // Validates config. Throws std::invalid_argument if invalid.
  //  - non-empty paths must start with '/' and contain neither spaces nor control characters
  //  - durations must be non-negative
  void validate() const;

  // Effective paths, with defaults applied.
  [[nodiscard]] std::string_view effectiveReadyPath() const noexcept {
    return readyPath.empty() ? kDefaultReadyPath : std::string_view(readyPath);
  }

  [[nodiscard]] std::string_view effectiveAlivePath() const noexcept {
    return alivePath.empty() ? kDefaultAlivePath : std::string_view(alivePath);
  }

  ProbeServerConfig& withReadyPath(std::string_view path);

  ProbeServerConfig& withReadyHandler(std::shared_ptr<HttpHandler> handler);

  ProbeServerConfig& withAlivePath(std::string_view path);

  ProbeServerConfig& withAliveHandler(std::shared_ptr<HttpHandler> handler);

  ProbeServerConfig& withWaitBeforeShutdown(std::chrono::milliseconds duration);

  ProbeServerConfig& withShutdownTimeout(std::chrono::milliseconds duration);
};

}  // namespace healthgate
