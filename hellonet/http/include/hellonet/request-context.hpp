#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "hellonet/http-constants.hpp"
#include "hellonet/http-header.hpp"
#include "hellonet/http-method.hpp"

namespace hellonet {

// Path part of a request target, normalized for routing:
//  - query string and fragment are removed
//  - absolute-form targets ('http://host/path') are reduced to their path
//  - an empty path becomes '/'
//  - one trailing slash is removed, except for the root path
// Returns a view into 'target'.
std::string_view NormalizePath(std::string_view target) noexcept;

// Read-only view of one request, as seen by the Router and the handlers.
class RequestContext {
 public:
  RequestContext(std::string_view method, std::string_view target, std::string_view version = http::HTTP11Sv,
                 std::vector<http::Header> headers = {});

  // Upper-cased request method, as received.
  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // Parsed method, std::nullopt if it is not one of the known methods.
  [[nodiscard]] std::optional<http::Method> knownMethod() const noexcept { return _knownMethod; }

  // Normalized path (see NormalizePath).
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw request target.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // "HTTP/1.0" or "HTTP/1.1".
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  // Get the value of the first header named 'name' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Value of header 'name', or 'defaultValue' if absent.
  [[nodiscard]] std::string_view headerValueOr(std::string_view name, std::string_view defaultValue) const noexcept;

  // Whether the connection may be reused after this request.
  // HTTP/1.1: unless 'Connection: close'. HTTP/1.0: only with 'Connection: keep-alive'.
  [[nodiscard]] bool keepAlive() const noexcept;

 private:
  std::string _method;
  std::string _target;
  std::string _version;
  std::string _path;
  std::vector<http::Header> _headers;
  std::optional<http::Method> _knownMethod;
};

}  // namespace hellonet
