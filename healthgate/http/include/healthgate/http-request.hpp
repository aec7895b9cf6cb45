#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "healthgate/http-method.hpp"

namespace healthgate {

class HttpRequest {
 public:
  struct HeaderView {
    std::string_view name;
    std::string_view value;
  };

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The raw request target, as received on the request line.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // The target without the query string. It cannot be empty and always starts with '/'.
  // Example:
  //  GET /path          -> '/path'
  //  GET /path?key=val  -> '/path'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // The query string without the leading '?', empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // "HTTP/1.0" or "HTTP/1.1".
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Header value lookup. Names are compared case-insensitively, and the first occurrence wins.
  // Leading and trailing whitespace around values are removed.
  //   * std::nullopt      => header not present in the request.
  //   * engaged empty     => header present with an empty value.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Headers in their order of appearance.
  [[nodiscard]] const std::vector<HeaderView>& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Whether the client asked for the connection to be closed after this request, taking the default
  // persistence rule of its HTTP version into account.
  [[nodiscard]] bool wantClose() const noexcept;

  // All views of a request point into the connection buffer; they are valid only during the handler call.

 private:
  friend class HttpRequestParser;

  void reset() noexcept;

  http::Method _method{http::Method::GET};
  std::string_view _target;
  std::string_view _path;
  std::string_view _query;
  std::string_view _version;
  std::vector<HeaderView> _headers;
  std::string_view _body;
};

}  // namespace healthgate
