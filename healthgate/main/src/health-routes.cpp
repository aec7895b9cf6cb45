#include "healthgate/health-routes.hpp"

#include <memory>
#include <utility>

#include "healthgate/http-handler.hpp"
#include "healthgate/log.hpp"
#include "healthgate/probe-server-config.hpp"
#include "healthgate/serve-mux.hpp"

namespace healthgate {

std::shared_ptr<ServeMux> BindHealthRoutes(const ProbeServerConfig& config, std::shared_ptr<HttpHandler> readyHandler,
                                           std::shared_ptr<HttpHandler> aliveHandler,
                                           std::shared_ptr<HttpHandler> appHandler) {
  auto mux = std::make_shared<ServeMux>();
  mux->handle(config.effectiveReadyPath(), std::move(readyHandler));
  mux->handle(config.effectiveAlivePath(), std::move(aliveHandler));
  if (!appHandler) {
    log::debug("No application handler, non probe paths are answered 404");
    appHandler = NotFoundHandler();
  }
  mux->handle("/", std::move(appHandler));
  return mux;
}

}  // namespace healthgate
