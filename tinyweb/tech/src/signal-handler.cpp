#include "tinyweb/signal-handler.hpp"

#include <csignal>

#include "tinyweb/log.hpp"

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void TinywebSignalHandler(int sigNum) {
  ::tinyweb::log::warn("Signal {} received, shutting down", sigNum);

  g_signalStatus = sigNum;
}

namespace tinyweb {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::TinywebSignalHandler);
  std::signal(SIGTERM, ::TinywebSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace tinyweb
