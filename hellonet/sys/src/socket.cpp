#include "hellonet/socket.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "hellonet/base-fd.hpp"
#include "hellonet/errno-throw.hpp"
#include "hellonet/log.hpp"
#include "hellonet/socket-ops.hpp"

namespace hellonet {

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo* ptr) const noexcept { ::freeaddrinfo(ptr); }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr Resolve(const std::string& host, uint16_t port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

  const std::string service = std::to_string(port);
  addrinfo* result = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw std::system_error(std::error_code(EADDRNOTAVAIL, std::generic_category()),
                            "Unable to resolve host '" + host + "': " + ::gai_strerror(rc));
  }
  return AddrInfoPtr(result);
}

}  // namespace

Socket::Socket(int family, int protocol)
    : _baseFd(::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, protocol)) {
  if (_baseFd.fd() == -1) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

Socket Socket::BindAndListen(std::string_view host, uint16_t port, int backlog) {
  const std::string hostStr(host);
  AddrInfoPtr addrs = Resolve(hostStr, port);

  int lastErr = EADDRNOTAVAIL;
  for (const addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
    Socket sock(ai->ai_family, ai->ai_protocol);

    static constexpr int kEnable = 1;
    if (::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
      throw_errno("setsockopt(SO_REUSEADDR) failed");
    }
    if (::bind(sock.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
      lastErr = errno;
      log::debug("bind failed for fd # {} ({}:{}): {}", sock.fd(), hostStr, port, std::strerror(lastErr));
      continue;
    }
    if (::listen(sock.fd(), backlog) != 0) {
      throw_errno("listen failed on {}:{}", hostStr, port);
    }
    return sock;
  }

  errno = lastErr;
  throw_errno("bind failed on {}:{}", hostStr, port);
}

uint16_t Socket::localPort() const noexcept {
  sockaddr_storage addr{};
  if (!_baseFd || !GetLocalAddress(_baseFd.fd(), addr)) {
    return 0;
  }
  return AddressPort(addr);
}

std::string Socket::localAddress() const {
  sockaddr_storage addr{};
  if (!_baseFd || !GetLocalAddress(_baseFd.fd(), addr)) {
    return "unknown";
  }
  return AddressToString(addr);
}

}  // namespace hellonet
