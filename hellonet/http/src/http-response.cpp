#include "hellonet/http-response.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "hellonet/http-constants.hpp"
#include "hellonet/http-header.hpp"
#include "hellonet/http-status-code.hpp"
#include "hellonet/string-equal-ignore-case.hpp"

namespace hellonet {

namespace {

void CheckStatusCode(http::StatusCode code) {
  if (code < 100 || code > 999) {
    throw std::invalid_argument("HTTP status code must be a 3 digits integer");
  }
}

}  // namespace

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) : _status(code), _reason(reason) {
  CheckStatusCode(code);
}

HttpResponse& HttpResponse::status(http::StatusCode code) {
  throwIfSealed();
  CheckStatusCode(code);
  _status = code;
  return *this;
}

HttpResponse& HttpResponse::reason(std::string_view reason) {
  throwIfSealed();
  _reason.assign(reason);
  return *this;
}

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  throwIfSealed();
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument("Invalid HTTP header name");
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument("Invalid HTTP header value");
  }
  auto it = std::ranges::find_if(_headers,
                                 [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    _headers.push_back(http::Header{std::string(name), std::string(value)});
  } else {
    it->name.assign(name);
    it->value.assign(value);
  }
  return *this;
}

HttpResponse& HttpResponse::body(std::string_view body) {
  throwIfSealed();
  _body.assign(body);
  return *this;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

void HttpResponse::seal() {
  if (_sealed) {
    throw std::logic_error("HTTP response already finalized");
  }
  _sealed = true;
}

std::string HttpResponse::serialize() const {
  std::string out;
  appendTo(out);
  return out;
}

void HttpResponse::appendTo(std::string& out) const {
  std::size_t size = http::HTTP11Sv.size() + 5U + _reason.size() + http::DoubleCRLF.size() + _body.size();
  for (const http::Header& header : _headers) {
    size += header.name.size() + http::HeaderSep.size() + header.value.size() + http::CRLF.size();
  }
  out.reserve(out.size() + size);

  out.append(http::HTTP11Sv);
  out.push_back(' ');
  out.append(std::to_string(_status));
  out.push_back(' ');
  out.append(_reason);
  out.append(http::CRLF);
  for (const http::Header& header : _headers) {
    out.append(header.name);
    out.append(http::HeaderSep);
    out.append(header.value);
    out.append(http::CRLF);
  }
  out.append(http::CRLF);
  out.append(_body);
}

void HttpResponse::throwIfSealed() const {
  if (_sealed) {
    throw std::logic_error("HTTP response cannot be modified after finalization");
  }
}

void ResponseSink::finalize() {
  _response.seal();
  commit(_response);
}

}  // namespace hellonet
