#pragma once

namespace anvil {

// Process wide SIGINT / SIGTERM watcher. Serve loops poll IsStopRequested() and return once it is set.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs the handler for SIGINT and SIGTERM. Throws std::system_error if it cannot be installed.
  static void Enable();

  // Restores the default disposition of SIGINT and SIGTERM.
  static void Disable();

  [[nodiscard]] static bool IsStopRequested() noexcept;

  // Number of the last termination signal received, 0 if none.
  [[nodiscard]] static int ReceivedSignal() noexcept;

 private:
  friend class SignalHandlerTest;

  // Allows several runs in the same process.
  static void ResetStopRequest() noexcept;
};

}  // namespace anvil
