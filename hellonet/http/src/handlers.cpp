#include "hellonet/handlers.hpp"

#include <exception>
#include <span>
#include <string>
#include <string_view>

#include "hellonet/http-constants.hpp"
#include "hellonet/http-header.hpp"
#include "hellonet/http-method.hpp"
#include "hellonet/http-response.hpp"
#include "hellonet/http-status-code.hpp"
#include "hellonet/log.hpp"
#include "hellonet/request-context.hpp"
#include "hellonet/response-writer.hpp"

namespace hellonet {

namespace {

std::string ExceptionDescription(const std::exception_ptr& error) {
  if (!error) {
    return "Unknown error occurred";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "non standard exception";
  }
}

}  // namespace

void HandleHello(const RequestContext& ctx, ResponseSink& sink) {
  log::info("Received request to /hello endpoint - Method: {}, URL: {}", ctx.method(), ctx.target());

  SendResponse(sink, http::StatusCodeOK, kHelloBody);

  log::info("Successfully processed /hello request - Status: {}, Message: \"{}\"", http::StatusCodeOK, kHelloBody);
}

void HandleNotFound(const RequestContext& ctx, ResponseSink& sink) {
  log::warn("404 Not Found - Method: {}, URL: {}", ctx.method(), ctx.target());

  SendResponse(sink, http::StatusCodeNotFound, kNotFoundBody);
}

void HandleMethodNotAllowed(const RequestContext& ctx, ResponseSink& sink, http::MethodBmp allowedMethods) {
  if (allowedMethods == 0) {
    log::warn("No allowed methods given for {}, advertising GET", ctx.path());
    allowedMethods = static_cast<http::MethodBmp>(http::Method::GET);
  }
  const std::string allow = http::JoinMethods(allowedMethods);

  log::warn("405 Method Not Allowed - Method: {}, URL: {}, Allowed Methods: {}", ctx.method(), ctx.target(), allow);

  const http::Header allowHeader{std::string(http::Allow), allow};
  SendResponse(sink, http::StatusCodeMethodNotAllowed, kMethodNotAllowedBody,
               std::span<const http::Header>(&allowHeader, 1));
}

void HandleServerError(const RequestContext& ctx, ResponseSink& sink, std::exception_ptr error) noexcept {
  try {
    log::error("500 Internal Server Error - Method: {}, URL: {}, Error: {}", ctx.method(), ctx.target(),
               ExceptionDescription(error));

    if (sink.finalized()) {
      log::error("Response for {} {} was already sent, unable to report the error to the client", ctx.method(),
                 ctx.target());
      return;
    }
    // Drop whatever the failing handler already put in the response.
    sink.response() = HttpResponse{};
    SendResponse(sink, http::StatusCodeInternalServerError, kServerErrorBody);
  } catch (const std::exception& ex) {
    log::critical("Unable to send the 500 response for {} {}: {}", ctx.method(), ctx.target(), ex.what());
  }
}

}  // namespace hellonet
