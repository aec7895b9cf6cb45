#include "healthgate/http-response.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "healthgate/http-constants.hpp"
#include "healthgate/http-status-code.hpp"
#include "healthgate/string-equal-ignore-case.hpp"

namespace healthgate {

namespace http {

bool IsReservedResponseHeader(std::string_view name) noexcept {
  static constexpr std::string_view kReservedHeaders[] = {"connection", "content-length", "date",   "te",
                                                          "trailer",    "transfer-encoding", "upgrade"};
  return std::ranges::any_of(kReservedHeaders,
                             [name](std::string_view reserved) { return CaseInsensitiveEqual(reserved, name); });
}

}  // namespace http

namespace {

bool HasCrOrLf(std::string_view str) noexcept { return str.find_first_of("\r\n") != std::string_view::npos; }

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(http::HeaderSep);
  out.append(value);
  out.append(http::CRLF);
}

}  // namespace

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [name](const Header& hdr) { return CaseInsensitiveEqual(hdr.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

void HttpResponse::setHeader(std::string_view name, std::string_view value) {
  if (name.empty() || HasCrOrLf(name) || HasCrOrLf(value)) {
    throw std::invalid_argument("Invalid response header");
  }
  if (http::IsReservedResponseHeader(name)) {
    throw std::invalid_argument("Response header is managed by the server and cannot be set");
  }
  const auto it =
      std::ranges::find_if(_headers, [name](const Header& hdr) { return CaseInsensitiveEqual(hdr.name, name); });
  if (it != _headers.end()) {
    it->value.assign(value);
  } else {
    _headers.push_back(Header{std::string(name), std::string(value)});
  }
}

void HttpResponse::setBody(std::string_view body, std::string_view contentType) {
  _body.assign(body);
  if (body.empty()) {
    std::erase_if(_headers, [](const Header& hdr) { return CaseInsensitiveEqual(hdr.name, http::ContentType); });
  } else {
    setHeader(http::ContentType, contentType);
  }
}

std::string HttpResponse::serialize(bool keepAlive, bool headOnly, std::string_view serverName) const {
  const std::string contentLength = std::to_string(_body.size());
  const std::string statusCode = std::to_string(_status);
  std::string_view reason = http::ReasonPhrase(_status);

  std::string out;
  out.reserve(128U + _body.size());

  out.append(http::HTTP11Sv);
  out.push_back(' ');
  out.append(statusCode);
  out.push_back(' ');
  out.append(reason);
  out.append(http::CRLF);

  if (!serverName.empty() && !headerValue(http::Server)) {
    AppendHeader(out, http::Server, serverName);
  }
  for (const auto& hdr : _headers) {
    AppendHeader(out, hdr.name, hdr.value);
  }
  AppendHeader(out, http::ContentLength, contentLength);
  AppendHeader(out, http::Connection, keepAlive ? http::keepalive : http::close);
  out.append(http::CRLF);

  if (!headOnly) {
    out.append(_body);
  }
  return out;
}

}  // namespace healthgate
