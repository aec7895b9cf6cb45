#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "healthgate/http-codec.hpp"

namespace healthgate {

// Options of the HttpServer wrapped by a ProbeServer.
struct HttpServerConfig {
  // Listening port, 0 for an ephemeral one. HttpServer::port() reports the bound value.
  uint16_t port{0};

  // SO_REUSEPORT on the listening socket.
  bool reusePort{false};

  // TCP_NODELAY on every accepted connection.
  bool tcpNoDelay{false};

  // When off, every response carries "Connection: close" whatever the client asked for.
  bool enableKeepAlive{true};

  // A persistent connection is closed once it has served this many requests.
  uint32_t maxRequestsPerConnection{100};

  // An idle persistent connection (no pending output, no partial request) is closed after this delay.
  // Zero disables the sweep.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::seconds{5}};

  // Head and body size bounds applied by the request parser (431 and 413 answers).
  RequestLimits requestLimits;

  // Longest single epoll wait, which is also the period of the idle sweep.
  // Shutdown and close wake the loop immediately whatever this value.
  std::chrono::milliseconds pollInterval{500};

  // Server header value, added when the handler did not set one. Empty means no header.
  std::string serverName{"healthgate"};

  // Throws std::invalid_argument on the first inconsistent option.
  void validate() const;

  HttpServerConfig& withPort(uint16_t listenPort);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withKeepAliveMode(bool on = true);

  HttpServerConfig& withMaxRequestsPerConnection(uint32_t nbRequests);

  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds idleTimeout);

  HttpServerConfig& withRequestLimits(RequestLimits limits);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds interval);

  HttpServerConfig& withServerName(std::string_view name);

  bool operator==(const HttpServerConfig&) const noexcept = default;
};

}  // namespace healthgate
