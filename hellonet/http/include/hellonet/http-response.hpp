#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "hellonet/http-header.hpp"
#include "hellonet/http-status-code.hpp"

namespace hellonet {

// Status line, ordered header list and body of one HTTP/1.1 response.
// Once sealed, the response is frozen: any mutation (and a second seal) throws std::logic_error.
class HttpResponse {
 public:
  // Constructs an HttpResponse with the given status code and optional reason phrase.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] bool sealed() const noexcept { return _sealed; }

  // Replaces the status code. Must be a 3 digits integer (std::invalid_argument otherwise).
  HttpResponse& status(http::StatusCode code);

  HttpResponse& reason(std::string_view reason);

  // Set or replace a header value ensuring at most one instance.
  // Header names are compared case-insensitively (RFC 7230); the casing of the new name is kept.
  // Throws std::invalid_argument for an invalid name or a value containing CR / LF.
  HttpResponse& header(std::string_view name, std::string_view value);

  HttpResponse& body(std::string_view body);

  // Get the value of the first header named 'name' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Freezes the response. Throws std::logic_error if it was already sealed.
  void seal();

  // HTTP/1.1 wire representation: status line, headers, blank line, body.
  [[nodiscard]] std::string serialize() const;

  // Appends serialize() to 'out'.
  void appendTo(std::string& out) const;

 private:
  void throwIfSealed() const;

  http::StatusCode _status;
  bool _sealed{false};
  std::string _reason;
  std::vector<http::Header> _headers;
  std::string _body;
};

// Destination of a response: the transport (one per request on a connection) or a test double.
// A sink accepts exactly one finalized response.
class ResponseSink {
 public:
  ResponseSink() = default;

  ResponseSink(const ResponseSink&) = delete;
  ResponseSink& operator=(const ResponseSink&) = delete;

  virtual ~ResponseSink() = default;

  // The response under construction.
  [[nodiscard]] HttpResponse& response() noexcept { return _response; }

  [[nodiscard]] const HttpResponse& response() const noexcept { return _response; }

  [[nodiscard]] bool finalized() const noexcept { return _response.sealed(); }

  // Seals the response and hands it to commit().
  // Throws std::logic_error if the sink was already finalized.
  void finalize();

 protected:
  // Called exactly once per sink, with the sealed response.
  virtual void commit(const HttpResponse& response) = 0;

 private:
  HttpResponse _response;
};

}  // namespace hellonet
