#include "hellonet/request-context.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "hellonet/ascii-case.hpp"
#include "hellonet/http-constants.hpp"
#include "hellonet/http-header.hpp"
#include "hellonet/http-method.hpp"
#include "hellonet/string-equal-ignore-case.hpp"

namespace hellonet {

std::string_view NormalizePath(std::string_view target) noexcept {
  std::string_view path = target.substr(0, target.find_first_of("?#"));

  // absolute-form: scheme "://" authority path
  if (const auto schemeEnd = path.find("://"); schemeEnd != std::string_view::npos && path.front() != '/') {
    path.remove_prefix(schemeEnd + 3);
    const auto pathBeg = path.find('/');
    path = pathBeg == std::string_view::npos ? std::string_view{} : path.substr(pathBeg);
  }

  if (path.empty()) {
    return "/";
  }
  if (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path;
}

RequestContext::RequestContext(std::string_view method, std::string_view target, std::string_view version,
                               std::vector<http::Header> headers)
    : _method(method),
      _target(target),
      _version(version),
      _path(NormalizePath(target)),
      _headers(std::move(headers)),
      _knownMethod(http::MethodStrToOptEnum(method)) {
  ToUpperAsciiInPlace(_method);
}

std::optional<std::string_view> RequestContext::headerValue(std::string_view name) const noexcept {
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

std::string_view RequestContext::headerValueOr(std::string_view name, std::string_view defaultValue) const noexcept {
  return headerValue(name).value_or(defaultValue);
}

bool RequestContext::keepAlive() const noexcept {
  const std::string_view connection = headerValueOr(http::Connection, {});
  if (ContainsTokenIgnoreCase(connection, http::close)) {
    return false;
  }
  if (_version == http::HTTP10Sv) {
    return ContainsTokenIgnoreCase(connection, http::keepalive);
  }
  return true;
}

}  // namespace hellonet
