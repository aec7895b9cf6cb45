#include <healthgate/healthgate.hpp>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace healthgate;

// Usage: probe-server [port] [wait-before-shutdown] [shutdown-timeout]
// Durations accept values such as "15s", "500ms" or "1m30s".
int main(int argc, char** argv) {
  uint16_t port = 8080;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  SignalHandler::Enable();

  try {
    ProbeServerConfig probeConfig;
    if (argc > 2) {
      probeConfig.withWaitBeforeShutdown(std::chrono::duration_cast<std::chrono::milliseconds>(ParseDuration(argv[2])));
    }
    if (argc > 3) {
      probeConfig.withShutdownTimeout(std::chrono::duration_cast<std::chrono::milliseconds>(ParseDuration(argv[3])));
    }

    auto app = MakeHandler([](const HttpRequest& req) {
      return HttpResponse(http::StatusCodeOK, "Hello from healthgate! You requested " + std::string(req.path()) + "\n");
    });

    auto server = WrapServer(std::make_shared<HttpServer>(HttpServerConfig{}.withPort(port), app), probeConfig);
    server->listenAndServe();

    // Ctrl+C (or SIGTERM) starts the shutdown sequence, unless the server stopped on its own.
    while (!SignalHandler::IsStopRequested() && !server->listenFinished()) {
      std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }

    if (const auto err = server->shutdown(); err) {
      std::cerr << "Shutdown error: " << err.message() << '\n';
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
