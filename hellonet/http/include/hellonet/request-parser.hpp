#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "hellonet/http-header.hpp"

namespace hellonet {

// Request line and header fields of one HTTP/1.x request.
struct RequestHead {
  std::string method;
  std::string target;
  std::string version;
  std::vector<http::Header> headers;
  // Number of bytes of the head, including the terminating CRLFCRLF (and skipped leading empty lines).
  std::size_t headLength{};
  // Declared body length (0 when no Content-Length header).
  std::size_t contentLength{};
};

struct ParseResult {
  enum class Status : uint8_t { NeedMore, Malformed, Complete };

  Status status{Status::NeedMore};
  // Human readable cause, set when status is Malformed.
  std::string_view reason;
  // Set when status is Complete.
  RequestHead head;
};

// Parses the request head at the beginning of 'buffer'.
//  - NeedMore: the head is not complete yet and does not exceed maxHeaderBytes.
//  - Malformed: the request line is not 'METHOD SP TARGET SP HTTP/1.x', the method is not a token, a header line
//    lacks ':' or has an invalid name or value, Content-Length is not a number, differs between occurrences or
//    exceeds maxBodyBytes, Transfer-Encoding is present, or the head exceeds maxHeaderBytes.
//  - Complete: 'head' is filled. The body (if any) follows at buffer[head.headLength].
ParseResult ParseRequestHead(std::string_view buffer, std::size_t maxHeaderBytes, std::size_t maxBodyBytes);

}  // namespace hellonet
