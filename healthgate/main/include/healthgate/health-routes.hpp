#pragma once

#include <memory>

#include "healthgate/http-handler.hpp"
#include "healthgate/probe-server-config.hpp"
#include "healthgate/serve-mux.hpp"

namespace healthgate {

// Builds the mux installed in front of the application:
//  - the effective readiness path is answered by 'readyHandler'
//  - the effective liveness path is answered by 'aliveHandler'
//  - every other path is delegated to 'appHandler', or answered 404 if it is null
// Probe handlers are registered before the catch-all, and a probe path equal to another one replaces it (last
// registration wins, no validation).
// Throws std::invalid_argument if a probe handler is null.
std::shared_ptr<ServeMux> BindHealthRoutes(const ProbeServerConfig& config, std::shared_ptr<HttpHandler> readyHandler,
                                           std::shared_ptr<HttpHandler> aliveHandler,
                                           std::shared_ptr<HttpHandler> appHandler);

}  // namespace healthgate
