#pragma once

namespace tinyweb {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request graceful shutdown.
  static void Enable();

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Resets the stop-requested flag, allowing several runs in the same process.
  static void ResetStopRequest();
};

}  // namespace tinyweb
