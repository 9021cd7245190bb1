#include "hellonet/connection.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>

#include "hellonet/base-fd.hpp"
#include "hellonet/log.hpp"
#include "hellonet/socket-ops.hpp"
#include "hellonet/socket.hpp"

namespace hellonet {

Connection::Connection(const Socket& socket) {
  sockaddr_storage peerAddr{};
  socklen_t peerLen = sizeof(peerAddr);
  const int fd =
      ::accept4(socket.fd(), reinterpret_cast<sockaddr*>(&peerAddr), &peerLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;  // capture errno before any other call
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("Connection accept would block: {} - this is expected if no pending connections",
                 std::strerror(savedErr));
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socket.fd(), std::strerror(savedErr));
    }
    return;
  }
  _baseFd = BaseFd(fd);
  _peer = AddressToString(peerAddr);
  log::debug("Connection fd # {} opened", fd);
}

}  // namespace hellonet
