#pragma once

#include <chrono>
#include <cstdint>

namespace hellonet {

// Process-wide termination signal hook (SIGINT, SIGTERM).
// The installed handler only records the signal number and counts it; ServerLifecycle polls NbStopRequests()
// from its event loop and turns a new request into a graceful drain.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs handlers for SIGINT and SIGTERM and ignores SIGPIPE.
  // maxDrainPeriod is the maximum time granted to in-flight requests once a signal has been received
  // (0: no limit).
  static void Enable(std::chrono::milliseconds maxDrainPeriod = std::chrono::milliseconds{10000});

  // Restores default signal dispositions.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Returns the number of the last received termination signal, 0 if none.
  static int ReceivedSignal();

  // Returns how many termination signals were received since the last reset.
  static uint32_t NbStopRequests();

  // Returns the maximum drain period configured at Enable() time.
  static std::chrono::milliseconds GetMaxDrainPeriod();

 private:
  friend class SignalHandlerTest;
  friend class SignalDrainTest;

  // Resets the stop-requested flag so that several tests can run in the same process.
  static void ResetStopRequest();
};

}  // namespace hellonet
