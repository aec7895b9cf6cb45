#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "healthgate/http-constants.hpp"
#include "healthgate/http-status-code.hpp"

namespace healthgate {

// HTTP response produced by a handler.
// Content-Length and Connection are computed by the server when the response is written and cannot be set
// directly.
class HttpResponse {
 public:
  struct Header {
    std::string name;
    std::string value;
  };

  // Creates a response with the given status code and an empty body.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK) noexcept : _status(code) {}

  // Creates a response with the given status code and body.
  HttpResponse(http::StatusCode code, std::string_view body, std::string_view contentType = http::ContentTypeTextPlain)
      : _status(code) {
    setBody(body, contentType);
  }

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  // Case-insensitive lookup of a header previously set with header().
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] const std::vector<Header>& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept {
    _status = statusCode;
    return std::move(*this);
  }

  // Sets a header, replacing any previous value for the same name (case-insensitive).
  // Throws std::invalid_argument if the name is empty, reserved (Connection, Content-Length, Date, TE, Trailer,
  // Transfer-Encoding, Upgrade), or if the name or value contain CR or LF.
  HttpResponse& header(std::string_view name, std::string_view value) & {
    setHeader(name, value);
    return *this;
  }

  HttpResponse&& header(std::string_view name, std::string_view value) && {
    setHeader(name, value);
    return std::move(*this);
  }

  HttpResponse& header(std::string_view name, std::integral auto value) & {
    setHeader(name, std::to_string(value));
    return *this;
  }

  HttpResponse&& header(std::string_view name, std::integral auto value) && {
    setHeader(name, std::to_string(value));
    return std::move(*this);
  }

  // Sets the body with its Content-Type. An empty body removes the Content-Type header.
  HttpResponse& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(body, contentType);
    return *this;
  }

  HttpResponse&& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(body, contentType);
    return std::move(*this);
  }

  // Serializes the response in HTTP/1.1 wire format.
  //  - 'keepAlive' selects the value of the Connection header
  //  - 'headOnly' omits the body while keeping its Content-Length (answer to a HEAD request)
  //  - 'serverName', if not empty, is emitted as Server header unless the handler set one
  [[nodiscard]] std::string serialize(bool keepAlive, bool headOnly, std::string_view serverName = {}) const;

 private:
  void setHeader(std::string_view name, std::string_view value);
  void setBody(std::string_view body, std::string_view contentType);

  http::StatusCode _status;
  std::vector<Header> _headers;
  std::string _body;
};

namespace http {

// Response headers the user may not set directly as they are managed by the server.
bool IsReservedResponseHeader(std::string_view name) noexcept;

}  // namespace http

}  // namespace healthgate
