#include "hellonet/response-writer.hpp"

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "hellonet/http-constants.hpp"
#include "hellonet/http-header.hpp"
#include "hellonet/http-reason-phrase.hpp"
#include "hellonet/http-response.hpp"
#include "hellonet/http-status-code.hpp"
#include "hellonet/log.hpp"

namespace hellonet {

void SendResponse(ResponseSink& sink, http::StatusCode statusCode, std::string_view body,
                  std::span<const http::Header> extraHeaders) {
  if (sink.finalized()) {
    throw std::logic_error("Response already sent");
  }

  HttpResponse& response = sink.response();
  response.status(statusCode).reason(http::ReasonPhrase(statusCode));
  response.header(http::ContentType, http::ContentTypeTextPlainUtf8);
  response.header(http::Connection, http::keepalive);
  for (const http::Header& header : extraHeaders) {
    response.header(header.name, header.value);
  }
  response.header(http::ContentLength, std::to_string(body.size()));
  response.body(body);

  sink.finalize();

  log::info("HTTP response sent - Status: {}, Bytes: {}", statusCode, body.size());
}

}  // namespace hellonet
