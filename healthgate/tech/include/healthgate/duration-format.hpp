#pragma once

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace healthgate {

// Log friendly rendering of a duration, largest unit first: "1m30s", "250ms", "-3s", "0s".
// '{:N}' (N in [1, 6]) keeps only the N most significant non zero units, truncating the rest.
struct PrettyDuration {
  std::chrono::nanoseconds dur;
};

namespace detail {

struct DurationUnit {
  std::string_view suffix;
  std::chrono::nanoseconds length;
};

// Same suffixes as ParseDuration.
inline constexpr std::array<DurationUnit, 6> kDurationUnits{{
    {"h", std::chrono::hours{1}},
    {"m", std::chrono::minutes{1}},
    {"s", std::chrono::seconds{1}},
    {"ms", std::chrono::milliseconds{1}},
    {"us", std::chrono::microseconds{1}},
    {"ns", std::chrono::nanoseconds{1}},
}};

}  // namespace detail

}  // namespace healthgate

template <>
struct fmt::formatter<::healthgate::PrettyDuration> {
  std::size_t maxUnits = ::healthgate::detail::kDurationUnits.size();

  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() && *it != '}') {
      if (*it < '1' || *it > static_cast<char>('0' + ::healthgate::detail::kDurationUnits.size())) {
        throw format_error("PrettyDuration precision must be a single digit in [1, 6]");
      }
      maxUnits = static_cast<std::size_t>(*it - '0');
      ++it;
    }
    if (it != ctx.end() && *it != '}') {
      throw format_error("unexpected character in PrettyDuration format spec");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(::healthgate::PrettyDuration pretty, FormatContext& ctx) const -> decltype(ctx.out()) {
    auto out = ctx.out();
    auto left = pretty.dur;
    if (left == std::chrono::nanoseconds::zero()) {
      return fmt::format_to(out, "0s");
    }
    if (left < std::chrono::nanoseconds::zero()) {
      *out++ = '-';
      left = -left;
    }
    std::size_t nbPrinted = 0;
    for (const auto& unit : ::healthgate::detail::kDurationUnits) {
      if (nbPrinted == maxUnits || left == std::chrono::nanoseconds::zero()) {
        break;
      }
      const auto count = left / unit.length;
      if (count != 0) {
        out = fmt::format_to(out, "{}{}", count, unit.suffix);
        left -= count * unit.length;
        ++nbPrinted;
      }
    }
    return out;
  }
};
