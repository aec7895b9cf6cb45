#include "healthgate/signal-handler.hpp"

#include <csignal>

#include "healthgate/errno-throw.hpp"
#include "healthgate/log.hpp"

namespace healthgate {

namespace {

volatile std::sig_atomic_t gStopSignal = 0;

void RecordStopSignal(int signum) { gStopSignal = signum; }

void SetDisposition(int signum, void (*handler)(int)) {
  struct sigaction action{};
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  // Blocking calls such as epoll_wait are resumed or return EINTR, both handled by the loop.
  action.sa_flags = SA_RESTART;
  if (::sigaction(signum, &action, nullptr) != 0) {
    throw_errno("sigaction failed for signal {}", signum);
  }
}

}  // namespace

void SignalHandler::Enable() {
  SetDisposition(SIGINT, RecordStopSignal);
  SetDisposition(SIGTERM, RecordStopSignal);
  log::debug("Termination signals will request a graceful shutdown");
}

void SignalHandler::Disable() noexcept {
  struct sigaction action{};
  action.sa_handler = SIG_DFL;
  sigemptyset(&action.sa_mask);
  for (const int signum : {SIGINT, SIGTERM}) {
    if (::sigaction(signum, &action, nullptr) != 0) {
      log::error("Unable to restore the default handler of signal {}", signum);
    }
  }
}

int SignalHandler::StopSignal() noexcept { return gStopSignal; }

void SignalHandler::ResetStopRequest() noexcept { gStopSignal = 0; }

}  // namespace healthgate
