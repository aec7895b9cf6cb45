#include <algorithm>
#include <iterator>
#include <optional>
#include <string_view>

#include "healthgate/http-method.hpp"

namespace healthgate::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) noexcept {
  const auto it = std::ranges::find(kMethodStrings, str);
  if (it == std::end(kMethodStrings)) {
    return std::nullopt;
  }
  return static_cast<Method>(std::distance(std::begin(kMethodStrings), it));
}

}  // namespace healthgate::http
