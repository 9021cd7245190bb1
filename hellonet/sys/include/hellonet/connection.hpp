#pragma once

#include <string>

#include "hellonet/base-fd.hpp"
#include "hellonet/socket.hpp"

namespace hellonet {

// Simple RAII class wrapping a connection accepted on a non-blocking listening socket.
// A default constructed (or failed) Connection is falsy.
class Connection {
 public:
  Connection() noexcept = default;

  // Accept the next pending connection of 'socket', if any.
  explicit Connection(const Socket& socket);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  // Remote address as 'ip:port', set at accept time.
  [[nodiscard]] const std::string& peer() const noexcept { return _peer; }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
  std::string _peer;
};

}  // namespace hellonet
