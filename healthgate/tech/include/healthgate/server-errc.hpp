#pragma once

#include <cstdint>
#include <system_error>
#include <type_traits>

namespace healthgate {

// Outcomes of server lifecycle operations that are not plain system errors.
enum class ServerErrc : std::uint8_t {
  // The listen loop ended because a graceful shutdown or a forced close was requested.
  ServerClosed = 1,
  // A bounded wait reached its deadline before completing.
  DeadlineExceeded,
  // A wait was interrupted through its stop token.
  Canceled,
  // The listen task terminated with an unexpected exception.
  ListenerFailure,
};

const std::error_category& ServerCategory() noexcept;

std::error_code make_error_code(ServerErrc errc) noexcept;

}  // namespace healthgate

template <>
struct std::is_error_code_enum<::healthgate::ServerErrc> : std::true_type {};
