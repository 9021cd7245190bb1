#pragma once

#include "hellonet/base-fd.hpp"

namespace hellonet {

// Simple RAII class wrapping an eventfd (non-blocking, close-on-exec), used to wake up a blocked poll.
class EventFd {
 public:
  // Throws std::system_error on failure.
  EventFd();

  // Send a wakeup event.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace hellonet
