#include "healthgate/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "healthgate/log.hpp"

namespace healthgate {

namespace {

// Smallest head able to hold a request line with a few headers.
constexpr std::size_t kMinHeaderBytes = 128;

void Check(bool condition, const char* what) {
  if (!condition) {
    log::critical("Invalid HttpServerConfig: {}", what);
    throw std::invalid_argument(what);
  }
}

}  // namespace

HttpServerConfig& HttpServerConfig::withPort(uint16_t listenPort) {
  port = listenPort;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveMode(bool on) {
  enableKeepAlive = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxRequestsPerConnection(uint32_t nbRequests) {
  maxRequestsPerConnection = nbRequests;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveTimeout(std::chrono::milliseconds idleTimeout) {
  keepAliveTimeout = idleTimeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withRequestLimits(RequestLimits limits) {
  requestLimits = limits;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  pollInterval = interval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withServerName(std::string_view name) {
  serverName = name;
  return *this;
}

void HttpServerConfig::validate() const {
  Check(requestLimits.maxHeaderBytes >= kMinHeaderBytes, "maxHeaderBytes must be at least 128");
  Check(requestLimits.maxBodyBytes != 0, "maxBodyBytes must be positive");
  Check(maxRequestsPerConnection != 0, "maxRequestsPerConnection must be positive");
  Check(keepAliveTimeout.count() >= 0, "keepAliveTimeout must not be negative");
  Check(pollInterval.count() > 0, "pollInterval must be positive");
  Check(std::cmp_less_equal(pollInterval.count(), std::numeric_limits<int>::max()),
        "pollInterval does not fit an epoll timeout");
  Check(!serverName.contains('\r') && !serverName.contains('\n'), "serverName must not contain CR or LF");
}

}  // namespace healthgate
