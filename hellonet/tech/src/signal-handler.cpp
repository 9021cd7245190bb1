#include "hellonet/signal-handler.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>

#include "hellonet/log.hpp"

namespace {

volatile std::sig_atomic_t g_signalStatus{};
std::atomic<uint32_t> g_nbStopRequests{};

static_assert(std::atomic<uint32_t>::is_always_lock_free);
std::chrono::milliseconds g_maxDrainPeriod{10000};

}  // namespace

// Only async-signal-safe work here: the event loop does the logging.
extern "C" void HellonetSignalHandler(int sigNum) {
  g_signalStatus = sigNum;
  g_nbStopRequests.fetch_add(1, std::memory_order_relaxed);
}

namespace hellonet {

void SignalHandler::Enable(std::chrono::milliseconds maxDrainPeriod) {
  std::signal(SIGINT, ::HellonetSignalHandler);
  std::signal(SIGTERM, ::HellonetSignalHandler);
  std::signal(SIGPIPE, SIG_IGN);
  g_maxDrainPeriod = maxDrainPeriod;
  log::debug("Signal handlers installed for SIGINT and SIGTERM (max drain period {}ms)", maxDrainPeriod.count());
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  std::signal(SIGPIPE, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

int SignalHandler::ReceivedSignal() { return static_cast<int>(g_signalStatus); }

uint32_t SignalHandler::NbStopRequests() { return g_nbStopRequests.load(std::memory_order_relaxed); }

std::chrono::milliseconds SignalHandler::GetMaxDrainPeriod() { return g_maxDrainPeriod; }

void SignalHandler::ResetStopRequest() {
  g_signalStatus = 0;
  g_nbStopRequests.store(0, std::memory_order_relaxed);
}

}  // namespace hellonet
