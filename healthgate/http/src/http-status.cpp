#include <algorithm>
#include <iterator>
#include <string_view>
#include <utility>

#include "healthgate/http-status-code.hpp"

namespace healthgate::http {

namespace {

// Sorted by code.
constexpr std::pair<StatusCode, std::string_view> kReasonPhrases[] = {
    {StatusCodeOK, "OK"},
    {StatusCodeAccepted, "Accepted"},
    {StatusCodeNoContent, "No Content"},
    {StatusCodeBadRequest, "Bad Request"},
    {StatusCodeNotFound, "Not Found"},
    {StatusCodePayloadTooLarge, "Payload Too Large"},
    {StatusCodeRequestHeaderFieldsTooLarge, "Request Header Fields Too Large"},
    {StatusCodeInternalServerError, "Internal Server Error"},
    {StatusCodeNotImplemented, "Not Implemented"},
    {StatusCodeServiceUnavailable, "Service Unavailable"},
    {StatusCodeHTTPVersionNotSupported, "HTTP Version Not Supported"},
};

static_assert(std::ranges::is_sorted(kReasonPhrases, {}, &std::pair<StatusCode, std::string_view>::first));

}  // namespace

std::string_view ReasonPhrase(StatusCode code) noexcept {
  const auto it = std::ranges::lower_bound(kReasonPhrases, code, {}, &std::pair<StatusCode, std::string_view>::first);
  if (it == std::end(kReasonPhrases) || it->first != code) {
    return {};
  }
  return it->second;
}

}  // namespace healthgate::http
