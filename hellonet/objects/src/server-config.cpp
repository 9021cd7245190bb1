#include "hellonet/server-config.hpp"

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "hellonet/log.hpp"
#include "hellonet/string-trim.hpp"

namespace hellonet {

namespace {

constexpr const char* kPortVar = "PORT";
constexpr const char* kHostVar = "HOST";
constexpr const char* kEnvironmentVar = "APP_ENV";
// Read when APP_ENV is unset, for deployments that still export the Node.js style variable.
constexpr const char* kLegacyEnvironmentVar = "NODE_ENV";

// Parses the leading integer of 'str' (optional sign then base-10 digits), ignoring trailing characters.
// "3001abc" -> 3001, "abc" -> nullopt. Values not fitting in int64 are reported as nullopt.
std::optional<int64_t> ParseIntegerPrefix(std::string_view str) {
  str = TrimSpaces(str);
  bool negative = false;
  if (!str.empty() && (str.front() == '+' || str.front() == '-')) {
    negative = str.front() == '-';
    str.remove_prefix(1);
  }
  if (str.empty() || str.front() < '0' || str.front() > '9') {
    return std::nullopt;
  }
  int64_t value = 0;
  const auto result = std::from_chars(str.data(), str.data() + str.size(), value);
  if (result.ec != std::errc{}) {
    return std::nullopt;
  }
  return negative ? -value : value;
}

uint16_t LoadPort(const EnvLookup& getEnv) {
  const char* raw = getEnv(kPortVar);
  if (raw == nullptr || *raw == '\0') {
    log::info("{} environment variable not set, using default port: {}", kPortVar, ServerConfig::kDefaultPort);
    return ServerConfig::kDefaultPort;
  }
  const auto parsed = ParseIntegerPrefix(raw);
  if (!parsed || *parsed < ServerConfig::kMinPort || *parsed > ServerConfig::kMaxPort) {
    log::warn("Invalid {} environment variable \"{}\". Port must be a number between {} and {}. Using default port: {}",
              kPortVar, raw, ServerConfig::kMinPort, ServerConfig::kMaxPort, ServerConfig::kDefaultPort);
    return ServerConfig::kDefaultPort;
  }
  const auto port = static_cast<uint16_t>(*parsed);
  log::info("Using {} from environment variable: {}", kPortVar, port);
  return port;
}

// Shared by HOST and APP_ENV (or NODE_ENV): non-empty string after trimming.
std::string LoadNonEmptyString(const EnvLookup& getEnv, const char* varName, std::string_view what,
                               std::string_view defaultValue) {
  const char* raw = getEnv(varName);
  if (raw == nullptr || *raw == '\0') {
    log::info("{} environment variable not set, using default {}: {}", varName, what, defaultValue);
    return std::string(defaultValue);
  }
  const std::string_view trimmed = TrimSpaces(raw);
  if (trimmed.empty()) {
    log::warn("Invalid {} environment variable \"{}\". {} must be a non-empty string. Using default {}: {}", varName,
              raw, what, what, defaultValue);
    return std::string(defaultValue);
  }
  log::info("Using {} from environment variable: {}", varName, trimmed);
  return std::string(trimmed);
}

}  // namespace

void ServerConfig::validate() const {
  if (port < kMinPort) {
    throw std::invalid_argument("port must be between 1025 and 65535");
  }
  if (TrimSpaces(host).empty()) {
    throw std::invalid_argument("host must be a non-empty string");
  }
  if (TrimSpaces(environment).empty()) {
    throw std::invalid_argument("environment must be a non-empty string");
  }
  if (backlog <= 0) {
    throw std::invalid_argument("backlog must be > 0");
  }
  if (idleTimeout.count() <= 0) {
    throw std::invalid_argument("idleTimeout must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (maxDrainPeriod.count() < 0) {
    throw std::invalid_argument("maxDrainPeriod must be non-negative");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withHost(std::string_view host) {
  this->host = host;
  return *this;
}

ServerConfig& ServerConfig::withEnvironment(std::string_view environment) {
  this->environment = environment;
  return *this;
}

ServerConfig& ServerConfig::withBacklog(int backlog) {
  this->backlog = backlog;
  return *this;
}

ServerConfig& ServerConfig::withIdleTimeout(std::chrono::milliseconds timeout) {
  idleTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  pollInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withMaxDrainPeriod(std::chrono::milliseconds period) {
  maxDrainPeriod = period;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig LoadServerConfig() { return LoadServerConfig([](const char* name) { return std::getenv(name); }); }

ServerConfig LoadServerConfig(const EnvLookup& getEnv) {
  ServerConfig config;
  config.port = LoadPort(getEnv);
  config.host = LoadNonEmptyString(getEnv, kHostVar, "host", ServerConfig::kDefaultHost);
  const char* environmentVar = kEnvironmentVar;
  if (const char* raw = getEnv(kEnvironmentVar); raw == nullptr || *raw == '\0') {
    if (const char* legacy = getEnv(kLegacyEnvironmentVar); legacy != nullptr && *legacy != '\0') {
      environmentVar = kLegacyEnvironmentVar;
    }
  }
  config.environment = LoadNonEmptyString(getEnv, environmentVar, "environment", ServerConfig::kDefaultEnvironment);

  log::info("Server configuration loaded successfully - Port: {}, Host: {}, Environment: {}", config.port, config.host,
            config.environment);
  return config;
}

}  // namespace hellonet
