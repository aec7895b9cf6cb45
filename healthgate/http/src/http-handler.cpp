#include "healthgate/http-handler.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "healthgate/http-request.hpp"
#include "healthgate/http-response.hpp"
#include "healthgate/http-status-code.hpp"

namespace healthgate {

namespace {

class FunctionHandler final : public HttpHandler {
 public:
  explicit FunctionHandler(RequestHandler handler) : _handler(std::move(handler)) {}

  HttpResponse serve(const HttpRequest& request) override { return _handler(request); }

 private:
  RequestHandler _handler;
};

class NotFound final : public HttpHandler {
 public:
  HttpResponse serve([[maybe_unused]] const HttpRequest& request) override {
    return HttpResponse(http::StatusCodeNotFound, "404 page not found\n");
  }
};

}  // namespace

std::shared_ptr<HttpHandler> MakeHandler(RequestHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Cannot make a handler from an empty function");
  }
  return std::make_shared<FunctionHandler>(std::move(handler));
}

std::shared_ptr<HttpHandler> NotFoundHandler() { return std::make_shared<NotFound>(); }

}  // namespace healthgate
