#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace hellonet {

struct ServerConfig {
  static constexpr uint16_t kDefaultPort = 3000;
  static constexpr uint16_t kMinPort = 1025;
  static constexpr uint16_t kMaxPort = 65535;

  static constexpr std::string_view kDefaultHost = "localhost";
  static constexpr std::string_view kDefaultEnvironment = "development";

  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. Ports below kMinPort are privileged and rejected.
  uint16_t port{kDefaultPort};

  // Host name or numeric address to bind.
  std::string host{kDefaultHost};

  // Deployment environment label (development, production ...). Informational only.
  std::string environment{kDefaultEnvironment};

  // Maximum length of the queue of pending connections passed to listen().
  int backlog{511};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // Connections without any activity for this long are closed. Default: 5000 ms.
  std::chrono::milliseconds idleTimeout{std::chrono::milliseconds{5000}};

  // Maximum duration the event loop blocks in a single poll when idle. It bounds the latency of
  // signal observation and of idle connection sweeping. Default: 500 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Maximum time granted to in-flight requests once draining started. Remaining connections are
  // force-closed when it expires. 0 means no limit. Default: 10 s.
  std::chrono::milliseconds maxDrainPeriod{std::chrono::milliseconds{10000}};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum size of the request head (request line + headers + CRLFCRLF). Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum accepted Content-Length. Default: 1 MiB.
  std::size_t maxBodyBytes{1 << 20};

  // Validates config. Throws std::invalid_argument on the first broken invariant.
  void validate() const;

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withHost(std::string_view host);

  ServerConfig& withEnvironment(std::string_view environment);

  ServerConfig& withBacklog(int backlog);

  ServerConfig& withIdleTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withPollInterval(std::chrono::milliseconds interval);

  ServerConfig& withMaxDrainPeriod(std::chrono::milliseconds period);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  bool operator==(const ServerConfig&) const noexcept = default;
};

// Same shape as std::getenv: returns nullptr when the variable is not set.
using EnvLookup = std::function<const char*(const char*)>;

// Builds the configuration snapshot from the process environment (PORT, HOST, APP_ENV or NODE_ENV).
// Never throws: unset values fall back to defaults (logged at info level), invalid ones too (logged at warning level).
ServerConfig LoadServerConfig();

ServerConfig LoadServerConfig(const EnvLookup& getEnv);

}  // namespace hellonet
