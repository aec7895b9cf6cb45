#include "healthgate/server-errc.hpp"

#include <string>
#include <system_error>

namespace healthgate {

namespace {

class ServerErrorCategory final : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "healthgate.server"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<ServerErrc>(value)) {
      case ServerErrc::ServerClosed:
        return "server closed";
      case ServerErrc::DeadlineExceeded:
        return "deadline exceeded";
      case ServerErrc::Canceled:
        return "operation canceled";
      case ServerErrc::ListenerFailure:
        return "listener terminated unexpectedly";
      default:
        return "unknown server error";
    }
  }

  [[nodiscard]] std::error_condition default_error_condition(int value) const noexcept override {
    switch (static_cast<ServerErrc>(value)) {
      case ServerErrc::DeadlineExceeded:
        return std::errc::timed_out;
      case ServerErrc::Canceled:
        return std::errc::operation_canceled;
      default:
        return {value, *this};
    }
  }
};

}  // namespace

const std::error_category& ServerCategory() noexcept {
  static const ServerErrorCategory kCategory;
  return kCategory;
}

std::error_code make_error_code(ServerErrc errc) noexcept { return {static_cast<int>(errc), ServerCategory()}; }

}  // namespace healthgate
