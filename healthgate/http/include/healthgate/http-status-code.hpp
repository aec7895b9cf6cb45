#pragma once

#include <cstdint>
#include <string_view>

namespace healthgate::http {

using StatusCode = int16_t;

// Codes produced by the server itself, by the probe handlers, or commonly returned by application handlers.
inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeAccepted = 202;
inline constexpr StatusCode StatusCodeNoContent = 204;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;
inline constexpr StatusCode StatusCodeHTTPVersionNotSupported = 505;

// Reason phrase written on the status line, empty for codes unknown to healthgate (the line stays valid).
std::string_view ReasonPhrase(StatusCode code) noexcept;

}  // namespace healthgate::http
