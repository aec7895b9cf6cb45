#pragma once

#include <algorithm>
#include <string_view>

namespace healthgate {

// ASCII only, header field names are tokens.
constexpr char AsciiLower(char ch) noexcept { return ('A' <= ch && ch <= 'Z') ? static_cast<char>(ch | 0x20) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return std::ranges::equal(lhs, rhs, [](char lc, char rc) { return AsciiLower(lc) == AsciiLower(rc); });
}

// Strips the optional whitespace (SP / HTAB) surrounding a field value.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  constexpr std::string_view kOws = " \t";
  const auto first = sv.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return sv.substr(sv.size());
  }
  return sv.substr(first, sv.find_last_not_of(kOws) - first + 1);
}

}  // namespace healthgate
