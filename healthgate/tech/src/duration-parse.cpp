#include "healthgate/duration-parse.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace healthgate {

namespace {

constexpr int64_t kNanosPerSecond = 1000L * 1000L * 1000L;

constexpr std::pair<std::string_view, int64_t> kDurationUnits[] = {
    {"ns", 1},
    {"us", 1000L},
    {"\xC2\xB5s", 1000L},
    {"ms", 1000L * 1000L},
    {"s", kNanosPerSecond},
    {"m", 60L * kNanosPerSecond},
    {"h", 3600L * kNanosPerSecond},
};

// Returns the number of nanoseconds of the unit at the beginning of 'str' and removes it from 'str'.
int64_t ConsumeUnit(std::string_view& str) {
  // Longest match first: "ms" must not be read as "m" followed by garbage.
  std::size_t bestLen = 0;
  int64_t bestMultiplier = 0;
  for (const auto& [unit, multiplier] : kDurationUnits) {
    if (str.starts_with(unit) && unit.size() > bestLen) {
      bestLen = unit.size();
      bestMultiplier = multiplier;
    }
  }
  if (bestLen == 0) {
    throw std::invalid_argument("Invalid or missing unit in duration");
  }
  str.remove_prefix(bestLen);
  return bestMultiplier;
}

int64_t ConsumeDigits(std::string_view& str, int64_t& scale) {
  int64_t value = 0;
  scale = 1;
  std::size_t pos = 0;
  for (; pos < str.size() && str[pos] >= '0' && str[pos] <= '9'; ++pos) {
    if (value > (std::numeric_limits<int64_t>::max() - 9) / 10) {
      throw std::invalid_argument("Duration overflow");
    }
    value = (value * 10) + (str[pos] - '0');
    scale *= scale < std::numeric_limits<int64_t>::max() / 10 ? 10 : 1;
  }
  str.remove_prefix(pos);
  return value;
}

}  // namespace

std::chrono::nanoseconds ParseDuration(std::string_view durationStr) {
  if (durationStr.empty()) {
    throw std::invalid_argument("Empty duration");
  }
  if (durationStr.front() == '-') {
    throw std::invalid_argument("Duration cannot be negative");
  }
  if (durationStr.front() == '+') {
    durationStr.remove_prefix(1);
  }
  if (durationStr == "0") {
    return std::chrono::nanoseconds::zero();
  }

  int64_t totalNs = 0;
  while (!durationStr.empty()) {
    const auto sizeBefore = durationStr.size();
    int64_t intScale;
    const int64_t intPart = ConsumeDigits(durationStr, intScale);
    const bool hasIntPart = durationStr.size() != sizeBefore;

    int64_t fracPart = 0;
    int64_t fracScale = 1;
    bool hasFracPart = false;
    if (!durationStr.empty() && durationStr.front() == '.') {
      durationStr.remove_prefix(1);
      const auto sizeBeforeFrac = durationStr.size();
      fracPart = ConsumeDigits(durationStr, fracScale);
      hasFracPart = durationStr.size() != sizeBeforeFrac;
    }
    if (!hasIntPart && !hasFracPart) {
      throw std::invalid_argument("Expected a number in duration");
    }

    const int64_t multiplier = ConsumeUnit(durationStr);
    if (intPart > std::numeric_limits<int64_t>::max() / multiplier) {
      throw std::invalid_argument("Duration overflow");
    }
    int64_t groupNs = intPart * multiplier;
    if (fracPart != 0) {
      groupNs += static_cast<int64_t>(static_cast<long double>(fracPart) * static_cast<long double>(multiplier) /
                                      static_cast<long double>(fracScale));
    }
    if (totalNs > std::numeric_limits<int64_t>::max() - groupNs) {
      throw std::invalid_argument("Duration overflow");
    }
    totalNs += groupNs;
  }
  return std::chrono::nanoseconds(totalNs);
}

}  // namespace healthgate
