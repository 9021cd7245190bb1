#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hellonet {

// Thin wrappers centralising socket system calls so that higher-level modules (http, main ...)
// never include networking headers directly.

// Fill `addr` with the local address bound to `fd`.
// Returns true on success.
bool GetLocalAddress(int fd, sockaddr_storage& addr) noexcept;

// Fill `addr` with the remote peer address of `fd`.
// Returns true on success.
bool GetPeerAddress(int fd, sockaddr_storage& addr) noexcept;

// Port of an AF_INET / AF_INET6 address in host byte order, 0 for other families.
uint16_t AddressPort(const sockaddr_storage& addr) noexcept;

// Human readable 'ip:port' ('[ip]:port' for IPv6). Returns "unknown" for unsupported families.
std::string AddressToString(const sockaddr_storage& addr);

// Send data on a connected socket with MSG_NOSIGNAL.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Receive data from a connected socket.
// Returns the number of bytes read, 0 on orderly peer shutdown, or -1 on error (errno is set).
int64_t SafeRecv(int fd, void* buf, std::size_t len) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(int fd) noexcept;

}  // namespace hellonet
