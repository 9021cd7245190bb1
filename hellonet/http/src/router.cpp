#include "hellonet/router.hpp"

#include <exception>

#include "hellonet/handlers.hpp"
#include "hellonet/http-constants.hpp"
#include "hellonet/http-method.hpp"
#include "hellonet/http-response.hpp"
#include "hellonet/log.hpp"
#include "hellonet/request-context.hpp"
#include "hellonet/route-table.hpp"

namespace hellonet {

void Router::route(const RequestContext& ctx, ResponseSink& sink) const {
  log::info("Processing request - Method: {}, Path: {}, Original URL: {}", ctx.method(), ctx.path(), ctx.target());
  log::debug("Request headers - Host: {}, User-Agent: {}", ctx.headerValueOr(http::Host, "unknown"),
             ctx.headerValueOr(http::UserAgent, "unknown"));

  try {
    dispatch(ctx, sink);
  } catch (const std::exception& ex) {
    log::error("Error during request routing for {} {}: {}", ctx.method(), ctx.target(), ex.what());
    HandleServerError(ctx, sink, std::current_exception());
    return;
  } catch (...) {
    log::error("Unknown error during request routing for {} {}", ctx.method(), ctx.target());
    HandleServerError(ctx, sink, std::current_exception());
    return;
  }

  if (!sink.finalized()) {
    log::error("Handler for {} {} returned without sending a response", ctx.method(), ctx.path());
    HandleServerError(ctx, sink);
  }
}

void Router::dispatch(const RequestContext& ctx, ResponseSink& sink) const {
  const RouteTable::PathRoutes* pathRoutes = _routeTable->find(ctx.path());
  if (pathRoutes == nullptr) {
    log::warn("Route not found for path: {}", ctx.path());
    HandleNotFound(ctx, sink);
    return;
  }

  const auto method = ctx.knownMethod();
  const Handler handler = method ? pathRoutes->handler(*method) : nullptr;
  if (handler == nullptr) {
    log::warn("Method {} not allowed for path {} - allowed methods: {}", ctx.method(), ctx.path(),
              http::JoinMethods(pathRoutes->methods));
    HandleMethodNotAllowed(ctx, sink, pathRoutes->methods);
    return;
  }

  log::info("Method {} is supported for path {} - dispatching to handler", ctx.method(), ctx.path());
  handler(ctx, sink);
  log::info("Handler dispatched successfully for {} {}", ctx.method(), ctx.path());
}

}  // namespace hellonet
