#pragma once

#include <span>
#include <string_view>

#include "hellonet/http-header.hpp"
#include "hellonet/http-response.hpp"
#include "hellonet/http-status-code.hpp"

namespace hellonet {

// Writes a complete plain text response into 'sink' and finalizes it:
//  - status code and its reason phrase
//  - Content-Type: text/plain; charset=utf-8 and Connection: keep-alive by default
//  - 'extraHeaders', overriding defaults of the same name (case-insensitive)
//  - Content-Length matching 'body'
// Throws std::logic_error if the sink was already finalized.
void SendResponse(ResponseSink& sink, http::StatusCode statusCode, std::string_view body,
                  std::span<const http::Header> extraHeaders = {});

}  // namespace hellonet
