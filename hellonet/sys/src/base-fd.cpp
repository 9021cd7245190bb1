#include "hellonet/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "hellonet/log.hpp"

namespace hellonet {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    BaseFd previous(std::exchange(_fd, other.release()));
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  const int fd = release();
  // On Linux the descriptor is released even when close() fails with EINTR, so it is never retried.
  if (::close(fd) != 0 && errno != EINTR) [[unlikely]] {
    log::error("Failed to close fd # {}: {}", fd, std::strerror(errno));
    return;
  }
  log::debug("Closed fd # {}", fd);
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace hellonet
