#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

#include "hellonet/base-fd.hpp"
#include "hellonet/event.hpp"

namespace hellonet {

// Thin RAII wrapper over epoll.
//
//  * The ready-event buffer starts with kInitialCapacity slots and doubles each time a poll
//    returns exactly capacity() events. It never shrinks.
//  * add()/del() return success/failure and log details on failure; caller
//    decides policy (drop connection / abort).
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if epoll_create1 fails.
  explicit EventLoop(std::chrono::milliseconds pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Delete fd from monitoring. Failures are logged at debug level only (fd usually already closed).
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  //
  //  - On success: returns a non-empty span over an internal, reusable buffer.
  //  - On timeout or when interrupted by a signal (EINTR): returns an empty span with non-null data().
  //  - On unrecoverable poll failure (already logged): returns an empty span with nullptr data().
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  int _pollTimeoutMs = 0;
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace hellonet
