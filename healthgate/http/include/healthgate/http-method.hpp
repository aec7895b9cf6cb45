#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>

namespace healthgate::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH };

// Indexed by Method.
inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

inline constexpr auto kNbMethods = static_cast<uint8_t>(std::size(kMethodStrings));

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[static_cast<uint8_t>(method)]; }

// Parses a method token. Method tokens are case-sensitive (RFC 9110 §9.1).
std::optional<Method> MethodStrToOptEnum(std::string_view str) noexcept;

}  // namespace healthgate::http
