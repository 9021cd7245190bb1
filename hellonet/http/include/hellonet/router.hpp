#pragma once

#include "hellonet/http-response.hpp"
#include "hellonet/request-context.hpp"
#include "hellonet/route-table.hpp"

namespace hellonet {

// Dispatches requests to the handlers of a RouteTable:
//  - unknown path                  -> HandleNotFound
//  - known path, method not routed -> HandleMethodNotAllowed (with the methods registered for the path)
//  - otherwise                     -> registered handler
// Exceptions escaping a handler (and handlers returning without finalizing the sink) are turned into a
// 500 response through HandleServerError. The Router performs no I/O by itself.
class Router {
 public:
  // 'routeTable' must outlive the Router.
  explicit Router(const RouteTable& routeTable) noexcept : _routeTable(&routeTable) {}

  void route(const RequestContext& ctx, ResponseSink& sink) const;

 private:
  void dispatch(const RequestContext& ctx, ResponseSink& sink) const;

  const RouteTable* _routeTable;
};

}  // namespace hellonet
