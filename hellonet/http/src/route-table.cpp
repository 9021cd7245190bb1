#include "hellonet/route-table.hpp"

#include <fmt/format.h>

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "hellonet/handlers.hpp"
#include "hellonet/http-method.hpp"
#include "hellonet/request-context.hpp"

namespace hellonet {

RouteTable::RouteTable(std::span<const RouteEntry> entries) {
  for (const RouteEntry& entry : entries) {
    if (entry.path.empty() || entry.path.front() != '/') {
      throw std::invalid_argument(fmt::format("Route path '{}' must start with '/'", entry.path));
    }
    if (NormalizePath(entry.path) != entry.path) {
      throw std::invalid_argument(fmt::format("Route path '{}' is not normalized", entry.path));
    }
    if (entry.handler == nullptr) {
      throw std::invalid_argument(fmt::format("Null handler for {} {}", http::MethodToStr(entry.method), entry.path));
    }
    auto it = _routes.find(entry.path);
    if (it == _routes.end()) {
      it = _routes.emplace(std::string(entry.path), PathRoutes{}).first;
    }
    PathRoutes& pathRoutes = it->second;
    if (http::IsMethodSet(pathRoutes.methods, entry.method)) {
      throw std::invalid_argument(
          fmt::format("Duplicate route for {} {}", http::MethodToStr(entry.method), entry.path));
    }
    pathRoutes.methods = pathRoutes.methods | entry.method;
    pathRoutes.handlers[http::MethodToIdx(entry.method)] = entry.handler;
  }
}

const RouteTable::PathRoutes* RouteTable::find(std::string_view path) const noexcept {
  const auto it = _routes.find(path);
  return it == _routes.end() ? nullptr : &it->second;
}

RouteTable DefaultRouteTable() { return RouteTable{{"/hello", http::Method::GET, HandleHello}}; }

}  // namespace hellonet
