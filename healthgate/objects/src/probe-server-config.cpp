#include "healthgate/probe-server-config.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "healthgate/duration-format.hpp"
#include "healthgate/http-handler.hpp"
#include "healthgate/log.hpp"

namespace healthgate {

namespace {

void CheckPath(std::string_view path, std::string_view name) {
  if (path.empty()) {
    // Falls back to the default path.
    return;
  }
  if (path.front() != '/') {
    log::critical("probe path '{}' must start with '/'", name);
    throw std::invalid_argument("probe path must start with '/'");
  }
  // Disallow spaces and control characters in probe paths
  if (std::ranges::any_of(path, [](unsigned char ch) { return ch <= 0x1F || ch == 0x7F || ch == ' '; })) {
    log::critical("probe path '{}' contains invalid characters", name);
    throw std::invalid_argument("probe path contains invalid characters");
  }
}

void CheckDuration(std::chrono::milliseconds duration, std::string_view name) {
  if (duration < std::chrono::milliseconds::zero()) {
    log::critical("{} must be non-negative, got {}", name, PrettyDuration{duration});
    throw std::invalid_argument("probe server durations must be non-negative");
  }
}

}  // namespace

void ProbeServerConfig::validate() const {
  CheckPath(readyPath, "readyPath");
  CheckPath(alivePath, "alivePath");
  CheckDuration(waitBeforeShutdown, "waitBeforeShutdown");
  CheckDuration(shutdownTimeout, "shutdownTimeout");
}

ProbeServerConfig& ProbeServerConfig::withReadyPath(std::string_view path) {
  readyPath = path;
  return *this;
}

ProbeServerConfig& ProbeServerConfig::withReadyHandler(std::shared_ptr<HttpHandler> handler) {
  readyHandler = std::move(handler);
  return *this;
}

ProbeServerConfig& ProbeServerConfig::withAlivePath(std::string_view path) {
  alivePath = path;
  return *this;
}

ProbeServerConfig& ProbeServerConfig::withAliveHandler(std::shared_ptr<HttpHandler> handler) {
  aliveHandler = std::move(handler);
  return *this;
}

ProbeServerConfig& ProbeServerConfig::withWaitBeforeShutdown(std::chrono::milliseconds duration) {
  waitBeforeShutdown = duration;
  return *this;
}

ProbeServerConfig& ProbeServerConfig::withShutdownTimeout(std::chrono::milliseconds duration) {
  shutdownTimeout = duration;
  return *this;
}

}  // namespace healthgate
