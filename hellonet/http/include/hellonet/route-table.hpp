#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <span>
#include <string>
#include <string_view>

#include "hellonet/handlers.hpp"
#include "hellonet/http-method.hpp"

namespace hellonet {

struct RouteEntry {
  std::string_view path;
  http::Method method;
  Handler handler;
};

// Immutable mapping from exact (normalized) path to the handlers registered for each method.
class RouteTable {
 public:
  // Handlers of one path, one slot per known HTTP method.
  struct PathRoutes {
    // Handler registered for 'method', nullptr if none.
    [[nodiscard]] Handler handler(http::Method method) const noexcept { return handlers[http::MethodToIdx(method)]; }

    http::MethodBmp methods{};
    std::array<Handler, http::kNbMethods> handlers{};
  };

  RouteTable() = default;

  // Throws std::invalid_argument if an entry has an empty, relative or non normalized path, a null handler,
  // or if the same (path, method) pair is registered twice.
  explicit RouteTable(std::span<const RouteEntry> entries);

  RouteTable(std::initializer_list<RouteEntry> entries)
      : RouteTable(std::span<const RouteEntry>(entries.begin(), entries.size())) {}

  // Routes of 'path', nullptr if the path is unknown.
  [[nodiscard]] const PathRoutes* find(std::string_view path) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _routes.size(); }

  [[nodiscard]] bool empty() const noexcept { return _routes.empty(); }

 private:
  std::map<std::string, PathRoutes, std::less<>> _routes;
};

// Routes of the application: GET /hello.
RouteTable DefaultRouteTable();

}  // namespace hellonet
