#include "hearth/signal-handler.hpp"

#include <chrono>
#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};
std::chrono::milliseconds g_maxDrainPeriod{5000};

}  // namespace

// Only async-signal-safe operations here: the signal is logged by the loops polling IsStopRequested().
extern "C" void HearthSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace hearth {

void SignalHandler::Enable(std::chrono::milliseconds maxDrainPeriod) {
  std::signal(SIGINT, ::HearthSignalHandler);
  std::signal(SIGTERM, ::HearthSignalHandler);
  g_maxDrainPeriod = maxDrainPeriod;
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

int SignalHandler::LastSignal() { return static_cast<int>(g_signalStatus); }

std::chrono::milliseconds SignalHandler::GetMaxDrainPeriod() { return g_maxDrainPeriod; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace hearth
