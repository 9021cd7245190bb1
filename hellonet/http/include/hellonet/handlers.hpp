#pragma once

#include <exception>
#include <string_view>

#include "hellonet/http-method.hpp"
#include "hellonet/http-response.hpp"
#include "hellonet/request-context.hpp"

namespace hellonet {

// A request handler produces one complete response into the sink.
using Handler = void (*)(const RequestContext&, ResponseSink&);

inline constexpr std::string_view kHelloBody = "Hello world";
inline constexpr std::string_view kNotFoundBody = "Not Found";
inline constexpr std::string_view kMethodNotAllowedBody = "Method Not Allowed";
inline constexpr std::string_view kServerErrorBody = "Internal Server Error";

// 200 'Hello world'. Headers, query and body of the request are ignored.
void HandleHello(const RequestContext& ctx, ResponseSink& sink);

// 404 'Not Found'.
void HandleNotFound(const RequestContext& ctx, ResponseSink& sink);

// 405 'Method Not Allowed' with an Allow header listing 'allowedMethods' in canonical order.
// An empty set is reported as 'GET' (and logged).
void HandleMethodNotAllowed(const RequestContext& ctx, ResponseSink& sink, http::MethodBmp allowedMethods);

// 500 'Internal Server Error'. The description of 'error' is logged, never sent to the client.
// Does nothing more than logging if the sink was already finalized.
void HandleServerError(const RequestContext& ctx, ResponseSink& sink, std::exception_ptr error = nullptr) noexcept;

}  // namespace hellonet
