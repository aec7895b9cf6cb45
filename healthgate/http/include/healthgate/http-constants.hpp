#pragma once

#include <string_view>

namespace healthgate::http {

// HTTP header field names are case-insensitive per RFC 7230. They are stored here in their conventional
// canonical form for emission; parsing code compares them case-insensitively.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";
inline constexpr std::string_view HTTPPrefixSv = "HTTP/";

// Standard Header Field Names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Server = "Server";

// Header values
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

}  // namespace healthgate::http
