#include "healthgate/http-codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <string_view>
#include <system_error>

#include "healthgate/http-constants.hpp"
#include "healthgate/http-method.hpp"
#include "healthgate/http-request.hpp"
#include "healthgate/http-status-code.hpp"
#include "healthgate/string-equal-ignore-case.hpp"

namespace healthgate {

namespace {

constexpr ParseResult Error(http::StatusCode status, std::string_view reason) {
  return ParseResult{ParseResult::Kind::Error, 0, status, reason};
}

// RFC 9110 token characters, used for header names.
constexpr bool IsTokenChar(char ch) {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").contains(ch);
}

constexpr bool HasControlChars(std::string_view value) {
  return std::ranges::any_of(value, [](char ch) {
    const auto uch = static_cast<unsigned char>(ch);
    return (uch < 0x20 && ch != '\t') || uch == 0x7F;
  });
}

}  // namespace

ParseResult HttpRequestParser::parse(std::string_view buffer, HttpRequest& request) const {
  const auto headEnd = buffer.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    if (buffer.size() > _limits.maxHeaderBytes) {
      return Error(http::StatusCodeRequestHeaderFieldsTooLarge, "request head too large");
    }
    return {};
  }
  const std::size_t headSize = headEnd + http::DoubleCRLF.size();
  if (headSize > _limits.maxHeaderBytes) {
    return Error(http::StatusCodeRequestHeaderFieldsTooLarge, "request head too large");
  }

  request.reset();

  std::string_view head = buffer.substr(0, headEnd);

  // Request line: method SP request-target SP HTTP-version
  const auto lineEnd = head.find(http::CRLF);
  std::string_view requestLine = head.substr(0, lineEnd);
  head = lineEnd == std::string_view::npos ? std::string_view{} : head.substr(lineEnd + http::CRLF.size());

  const auto firstSp = requestLine.find(' ');
  const auto lastSp = requestLine.rfind(' ');
  if (firstSp == std::string_view::npos || firstSp == lastSp) {
    return Error(http::StatusCodeBadRequest, "malformed request line");
  }
  const std::string_view methodStr = requestLine.substr(0, firstSp);
  const std::string_view target = requestLine.substr(firstSp + 1, lastSp - firstSp - 1);
  const std::string_view version = requestLine.substr(lastSp + 1);

  if (target.empty() || target.front() != '/' || target.contains(' ') || HasControlChars(target)) {
    return Error(http::StatusCodeBadRequest, "malformed request target");
  }
  if (version != http::HTTP11Sv && version != http::HTTP10Sv) {
    if (version.starts_with(http::HTTPPrefixSv)) {
      return Error(http::StatusCodeHTTPVersionNotSupported, "unsupported HTTP version");
    }
    return Error(http::StatusCodeBadRequest, "malformed HTTP version");
  }
  const auto method = http::MethodStrToOptEnum(methodStr);
  if (!method) {
    if (methodStr.empty() || !std::ranges::all_of(methodStr, IsTokenChar)) {
      return Error(http::StatusCodeBadRequest, "malformed method");
    }
    return Error(http::StatusCodeNotImplemented, "unknown method");
  }

  request._method = *method;
  request._target = target;
  request._version = version;
  const auto queryPos = target.find('?');
  request._path = target.substr(0, queryPos);
  request._query = queryPos == std::string_view::npos ? std::string_view{} : target.substr(queryPos + 1);

  // Header fields
  while (!head.empty()) {
    const auto endPos = head.find(http::CRLF);
    const std::string_view line = head.substr(0, endPos);
    head = endPos == std::string_view::npos ? std::string_view{} : head.substr(endPos + http::CRLF.size());

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || colonPos == 0) {
      return Error(http::StatusCodeBadRequest, "malformed header line");
    }
    const std::string_view name = line.substr(0, colonPos);
    if (!std::ranges::all_of(name, IsTokenChar)) {
      return Error(http::StatusCodeBadRequest, "invalid header name");
    }
    const std::string_view value = TrimOws(line.substr(colonPos + 1));
    if (HasControlChars(value)) {
      return Error(http::StatusCodeBadRequest, "invalid header value");
    }
    request._headers.push_back(HttpRequest::HeaderView{name, value});
  }

  if (request.headerValue(http::TransferEncoding)) {
    return Error(http::StatusCodeNotImplemented, "transfer encodings are not supported");
  }

  std::size_t contentLength = 0;
  bool hasContentLength = false;
  for (const auto& header : request._headers) {
    if (!CaseInsensitiveEqual(header.name, http::ContentLength)) {
      continue;
    }
    if (hasContentLength) {
      return Error(http::StatusCodeBadRequest, "duplicate Content-Length");
    }
    hasContentLength = true;
    const char* first = header.value.data();
    const char* last = first + header.value.size();
    const auto [ptr, errc] = std::from_chars(first, last, contentLength);
    if (header.value.empty() || errc != std::errc{} || ptr != last) {
      return Error(http::StatusCodeBadRequest, "invalid Content-Length");
    }
  }
  if (contentLength > _limits.maxBodyBytes) {
    return Error(http::StatusCodePayloadTooLarge, "body too large");
  }
  if (buffer.size() - headSize < contentLength) {
    return {};
  }

  request._body = buffer.substr(headSize, contentLength);
  return ParseResult{ParseResult::Kind::Complete, headSize + contentLength, http::StatusCodeOK, {}};
}

}  // namespace healthgate
