// healthgate Umbrella Header
//
// Include this single header to pull in the public API:
//   - Server types (Server interface, HttpServer, ProbeServer and WrapServer)
//   - Configuration types (HttpServerConfig, ProbeServerConfig)
//   - Handlers (HttpHandler, ServeMux, ReadinessHandler, SettableReadiness)
//   - Shutdown primitives (Deadline, ServerErrc)
//
// Lower level pieces (event loop, sockets, parser) are internal and not re-exported.
//
// Usage Example:
//    #include <healthgate/healthgate.hpp>
//    using namespace healthgate;
//    int main() {
//      auto app = MakeHandler([](const HttpRequest&) { return HttpResponse(200, "hi\n"); });
//      auto server = WrapServer(std::make_shared<HttpServer>(HttpServerConfig{}.withPort(8080), app));
//      server->listenAndServe();
//      // ... wait for a termination signal
//      return server->shutdown() ? 1 : 0;
//    }

#pragma once

// Servers
#include "healthgate/http-server.hpp"   // IWYU pragma: export
#include "healthgate/probe-server.hpp"  // IWYU pragma: export
#include "healthgate/server.hpp"        // IWYU pragma: export

// Configuration
#include "healthgate/http-server-config.hpp"   // IWYU pragma: export
#include "healthgate/probe-server-config.hpp"  // IWYU pragma: export
#include "healthgate/signal-handler.hpp"       // IWYU pragma: export

// Handlers
#include "healthgate/health-routes.hpp"       // IWYU pragma: export
#include "healthgate/http-handler.hpp"        // IWYU pragma: export
#include "healthgate/readiness-handler.hpp"   // IWYU pragma: export
#include "healthgate/serve-mux.hpp"           // IWYU pragma: export
#include "healthgate/settable-readiness.hpp"  // IWYU pragma: export

// HTTP primitives
#include "healthgate/http-method.hpp"       // IWYU pragma: export
#include "healthgate/http-request.hpp"      // IWYU pragma: export
#include "healthgate/http-response.hpp"     // IWYU pragma: export
#include "healthgate/http-status-code.hpp"  // IWYU pragma: export

// Shutdown primitives
#include "healthgate/deadline.hpp"        // IWYU pragma: export
#include "healthgate/duration-parse.hpp"  // IWYU pragma: export
#include "healthgate/server-errc.hpp"     // IWYU pragma: export
