#include "healthgate/readiness-handler.hpp"

#include <mutex>

#include "healthgate/http-request.hpp"
#include "healthgate/http-response.hpp"
#include "healthgate/http-status-code.hpp"
#include "healthgate/log.hpp"

namespace healthgate {

HttpResponse ReadinessHandler::serve([[maybe_unused]] const HttpRequest& request) {
  std::lock_guard<std::mutex> lock(_mutex);
  return HttpResponse(_ready ? http::StatusCodeOK : http::StatusCodeServiceUnavailable);
}

void ReadinessHandler::setReady(bool ready) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_ready != ready) {
    log::debug("Readiness set to {}", ready);
  }
  _ready = ready;
}

bool ReadinessHandler::ready() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _ready;
}

}  // namespace healthgate
