#pragma once

#include <functional>
#include <memory>

#include "healthgate/http-request.hpp"
#include "healthgate/http-response.hpp"

namespace healthgate {

// Answers HTTP requests.
// Implementations are called from the server event loop thread and must be safe to call concurrently with any
// state they share with other threads.
class HttpHandler {
 public:
  HttpHandler() = default;

  HttpHandler(const HttpHandler&) = delete;
  HttpHandler(HttpHandler&&) = delete;
  HttpHandler& operator=(const HttpHandler&) = delete;
  HttpHandler& operator=(HttpHandler&&) = delete;

  virtual ~HttpHandler() = default;

  virtual HttpResponse serve(const HttpRequest& request) = 0;
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

// Adapts a callable into a handler.
// Throws std::invalid_argument if 'handler' is empty.
std::shared_ptr<HttpHandler> MakeHandler(RequestHandler handler);

// Handler answering 404 Not Found to every request.
std::shared_ptr<HttpHandler> NotFoundHandler();

}  // namespace healthgate
