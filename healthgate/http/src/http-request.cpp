#include "healthgate/http-request.hpp"

#include <optional>
#include <string_view>

#include "healthgate/http-constants.hpp"
#include "healthgate/string-equal-ignore-case.hpp"

namespace healthgate {

namespace {

// Returns true if the comma separated list 'value' contains 'token' (case-insensitive).
bool HasToken(std::string_view value, std::string_view token) noexcept {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    if (CaseInsensitiveEqual(TrimOws(value.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  for (const auto& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return header.value;
    }
  }
  return std::nullopt;
}

bool HttpRequest::wantClose() const noexcept {
  const auto connection = headerValue(http::Connection);
  if (_version == http::HTTP10Sv) {
    return !connection || !HasToken(*connection, http::keepalive);
  }
  return connection && HasToken(*connection, http::close);
}

void HttpRequest::reset() noexcept {
  _method = http::Method::GET;
  _target = {};
  _path = {};
  _query = {};
  _version = {};
  _headers.clear();
  _body = {};
}

}  // namespace healthgate
