#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <system_error>
#include <thread>

#include "healthgate/http-handler.hpp"
#include "healthgate/http-server-config.hpp"
#include "healthgate/http-server.hpp"

namespace healthgate::test {

// HttpServer bound on an ephemeral port and serving from a background thread.
// The constructor returns once the event loop runs. Destruction force-closes the server unless join() was called.
class TestServer {
 public:
  explicit TestServer(HttpServerConfig cfg = {}, std::shared_ptr<HttpHandler> handler = nullptr,
                      std::chrono::milliseconds readyTimeout = std::chrono::milliseconds{2000});

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) = delete;

  ~TestServer();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Blocks until listenAndServe returns (after a shutdown or close issued by the test) and gives its result.
  std::error_code join();

  std::shared_ptr<HttpServer> server;

 private:
  uint16_t _port;
  std::error_code _listenResult;
  std::jthread _loopThread;
};

}  // namespace healthgate::test
