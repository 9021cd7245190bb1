#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "hellonet/base-fd.hpp"

namespace hellonet {

// Simple RAII class wrapping a non-blocking, close-on-exec stream socket.
class Socket {
 public:
  Socket() noexcept = default;

  // Construct a socket for the given address family (AF_INET, AF_INET6).
  // Throws std::system_error on failure.
  explicit Socket(int family, int protocol = 0);

  // Resolves 'host' (numeric address or name), then binds and listens on the first address that accepts the bind.
  // If port is 0, an ephemeral port is chosen by the kernel (see localPort()).
  // Throws std::system_error on failure. Resolution failures are reported with EADDRNOTAVAIL.
  static Socket BindAndListen(std::string_view host, uint16_t port, int backlog);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Port the socket is bound to, 0 if not bound.
  [[nodiscard]] uint16_t localPort() const noexcept;

  // Bound address as 'ip:port'.
  [[nodiscard]] std::string localAddress() const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace hellonet
