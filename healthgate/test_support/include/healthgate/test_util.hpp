#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "healthgate/http-status-code.hpp"
#include "healthgate/socket.hpp"

namespace healthgate::test {
using namespace std::chrono_literals;

// Blocking loopback client socket, connected at construction (retried until 'timeout').
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = std::chrono::milliseconds{1000});

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

  [[nodiscard]] bool connected() const noexcept { return _connected; }

 private:
  ::healthgate::Socket _socket;
  bool _connected{false};
};

struct ParsedResponse {
  ::healthgate::http::StatusCode statusCode{0};
  std::string reason;
  // Keys as sent by the server, last occurrence wins.
  std::map<std::string, std::string> headers;
  std::string body;
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string host{"localhost"};
  std::string connection{"close"};
  std::string body;
  // Sent after Host and Connection.
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds recvTimeout{2000};
};

// Retries partial and would-block sends until 'totalTimeout'. Gives up at once on EPIPE or ECONNRESET.
bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Stops after one full Content-Length framed response, on peer close, or at 'totalTimeout'.
std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// Blocking reads until EOF (or the receive timeout of the socket, if any).
std::string recvUntilClosed(int fd);

std::string buildRequest(const RequestOptions& opt);

// GET with Connection: close. Empty string when nothing could be sent.
std::string simpleGet(uint16_t port, std::string_view path);

// Sends one request on a fresh connection and returns the raw response, std::nullopt on connect or send failure.
std::optional<std::string> request(uint16_t port, const RequestOptions& opt = {});

// Parses the first response of 'raw'. The body is everything after the head.
std::optional<ParsedResponse> parseResponse(std::string_view raw);

// Status code of a raw response, 0 if it cannot be parsed (empty response included).
::healthgate::http::StatusCode statusOf(std::string_view raw);

// 0 when no response came back.
::healthgate::http::StatusCode getStatus(uint16_t port, std::string_view path);

bool AttemptConnect(uint16_t port);

// True once recv reports EOF or a reset within 'timeout'. Pending data is read and dropped.
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

bool WaitForListenerClosed(uint16_t port, std::chrono::milliseconds timeout);

// Polls 'pred' every millisecond until it holds or 'timeout' elapses. Returns the final value of 'pred'.
template <class Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return pred();
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

}  // namespace healthgate::test
