#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "healthgate/http-request.hpp"
#include "healthgate/http-status-code.hpp"

namespace healthgate {

struct RequestLimits {
  // Maximum size of the request line plus headers, including the terminating empty line.
  std::size_t maxHeaderBytes{8UL << 10};
  // Maximum size of a Content-Length delimited body.
  std::size_t maxBodyBytes{1UL << 20};

  bool operator==(const RequestLimits&) const noexcept = default;
};

struct ParseResult {
  enum class Kind : std::uint8_t { NeedMore, Complete, Error };

  Kind kind{Kind::NeedMore};
  // Number of bytes of the buffer making up the request, when Complete.
  std::size_t consumed{};
  // Status code to answer with, when Error.
  http::StatusCode status{http::StatusCodeOK};
  // Short human readable description of the error, when Error.
  std::string_view reason;
};

// Incremental HTTP/1.1 request parser.
// Only bodies delimited by Content-Length are supported, a Transfer-Encoding header is answered with 501.
class HttpRequestParser {
 public:
  explicit HttpRequestParser(RequestLimits limits = {}) noexcept : _limits(limits) {}

  // Tries to parse one request at the beginning of 'buffer'.
  // On Complete, 'request' views point into 'buffer'.
  ParseResult parse(std::string_view buffer, HttpRequest& request) const;

  [[nodiscard]] const RequestLimits& limits() const noexcept { return _limits; }

 private:
  RequestLimits _limits;
};

}  // namespace healthgate
