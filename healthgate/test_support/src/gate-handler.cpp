#include "healthgate/gate-handler.hpp"

#include <cstdint>
#include <mutex>

#include "healthgate/http-request.hpp"
#include "healthgate/http-response.hpp"
#include "healthgate/http-status-code.hpp"
#include "healthgate/log.hpp"
#include "healthgate/timedef.hpp"

namespace healthgate::test {

HttpResponse GateHandler::serve([[maybe_unused]] const HttpRequest& request) {
  std::unique_lock<std::mutex> lock(_mutex);
  ++_nbEntered;
  _cv.notify_all();
  if (!_cv.wait_for(lock, _safetyTimeout, [this] { return _released; })) {
    log::warn("GateHandler released by its safety timeout");
  }
  return HttpResponse(http::StatusCodeOK, "done");
}

bool GateHandler::waitEntered(SteadyDuration timeout) {
  std::unique_lock<std::mutex> lock(_mutex);
  return _cv.wait_for(lock, timeout, [this] { return _nbEntered > 0; });
}

void GateHandler::release() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _released = true;
  }
  _cv.notify_all();
}

uint32_t GateHandler::nbEntered() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _nbEntered;
}

}  // namespace healthgate::test
