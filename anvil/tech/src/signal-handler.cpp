#include "anvil/signal-handler.hpp"

#include <signal.h>

#include <atomic>
#include <cerrno>
#include <system_error>

#include "anvil/system-error.hpp"

namespace anvil {

namespace {

std::atomic<int> gReceivedSignal{0};

static_assert(std::atomic<int>::is_always_lock_free);

extern "C" void RecordTerminationSignal(int sigNum) { gReceivedSignal.store(sigNum, std::memory_order_relaxed); }

void SetDisposition(int sigNum, void (*handler)(int)) {
  struct sigaction action{};
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  if (::sigaction(sigNum, &action, nullptr) != 0) {
    ThrowSystemError(std::error_code(errno, std::system_category()), "Unable to set disposition of signal {}",
                     sigNum);
  }
}

}  // namespace

void SignalHandler::Enable() {
  for (int sigNum : {SIGINT, SIGTERM}) {
    SetDisposition(sigNum, RecordTerminationSignal);
  }
}

void SignalHandler::Disable() {
  for (int sigNum : {SIGINT, SIGTERM}) {
    SetDisposition(sigNum, SIG_DFL);
  }
}

bool SignalHandler::IsStopRequested() noexcept { return ReceivedSignal() != 0; }

int SignalHandler::ReceivedSignal() noexcept { return gReceivedSignal.load(std::memory_order_relaxed); }

void SignalHandler::ResetStopRequest() noexcept { gReceivedSignal.store(0, std::memory_order_relaxed); }

}  // namespace anvil
