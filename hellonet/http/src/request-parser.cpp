#include "hellonet/request-parser.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "hellonet/http-constants.hpp"
#include "hellonet/http-header.hpp"
#include "hellonet/string-equal-ignore-case.hpp"
#include "hellonet/string-trim.hpp"

namespace hellonet {

namespace {

ParseResult Malformed(std::string_view reason) {
  ParseResult result;
  result.status = ParseResult::Status::Malformed;
  result.reason = reason;
  return result;
}

constexpr bool IsValidTarget(std::string_view target) noexcept {
  if (target.empty()) {
    return false;
  }
  for (char ch : target) {
    if (static_cast<unsigned char>(ch) <= 0x20 || ch == 0x7F) {
      return false;
    }
  }
  return true;
}

// "HTTP/1.x", x being a single digit.
constexpr bool IsValidVersion(std::string_view version) noexcept {
  return version.size() == http::HTTP11Sv.size() && version.starts_with("HTTP/1.") && version.back() >= '0' &&
         version.back() <= '9';
}

std::optional<std::size_t> ParseContentLength(std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  std::size_t length = 0;
  const auto result = std::from_chars(value.data(), value.data() + value.size(), length);
  if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return length;
}

}  // namespace

ParseResult ParseRequestHead(std::string_view buffer, std::size_t maxHeaderBytes, std::size_t maxBodyBytes) {
  // RFC 9112 §2.2: ignore at least one empty line received prior to the request-line.
  std::size_t leading = 0;
  while (buffer.substr(leading).starts_with(http::CRLF)) {
    leading += http::CRLF.size();
  }

  const auto headEnd = buffer.find(http::DoubleCRLF, leading);
  if (headEnd == std::string_view::npos) {
    if (buffer.size() > maxHeaderBytes) {
      return Malformed("request head too large");
    }
    return {};
  }
  const std::size_t headLength = headEnd + http::DoubleCRLF.size();
  if (headLength > maxHeaderBytes) {
    return Malformed("request head too large");
  }

  // Work on the lines between the request line start and the final CRLF (exclusive of the empty line).
  std::string_view lines = buffer.substr(leading, headEnd + http::CRLF.size() - leading);

  const auto requestLineEnd = lines.find(http::CRLF);
  const std::string_view requestLine = lines.substr(0, requestLineEnd);
  lines.remove_prefix(requestLineEnd + http::CRLF.size());

  const auto firstSp = requestLine.find(' ');
  if (firstSp == std::string_view::npos) {
    return Malformed("invalid request line");
  }
  const auto secondSp = requestLine.find(' ', firstSp + 1);
  if (secondSp == std::string_view::npos || requestLine.find(' ', secondSp + 1) != std::string_view::npos) {
    return Malformed("invalid request line");
  }
  const std::string_view method = requestLine.substr(0, firstSp);
  const std::string_view target = requestLine.substr(firstSp + 1, secondSp - firstSp - 1);
  const std::string_view version = requestLine.substr(secondSp + 1);

  if (!http::IsValidToken(method)) {
    return Malformed("invalid method");
  }
  if (!IsValidTarget(target)) {
    return Malformed("invalid request target");
  }
  if (!IsValidVersion(version)) {
    return Malformed("invalid HTTP version");
  }

  ParseResult result;
  RequestHead& head = result.head;
  std::optional<std::size_t> contentLength;

  while (!lines.empty()) {
    const auto lineEnd = lines.find(http::CRLF);
    const std::string_view line = lines.substr(0, lineEnd);
    lines.remove_prefix(lineEnd + http::CRLF.size());

    if (http::IsHeaderWhitespace(line.front())) {
      // obs-fold (RFC 9112 §5.2) is not supported.
      return Malformed("folded header line");
    }
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      return Malformed("header line without ':'");
    }
    const std::string_view name = line.substr(0, colonPos);
    const std::string_view value = TrimOws(line.substr(colonPos + 1));
    if (!http::IsValidHeaderName(name)) {
      return Malformed("invalid header name");
    }
    if (!http::IsValidHeaderValue(value)) {
      return Malformed("invalid header value");
    }

    if (CaseInsensitiveEqual(name, http::TransferEncoding)) {
      return Malformed("Transfer-Encoding is not supported");
    }
    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      const auto length = ParseContentLength(value);
      if (!length) {
        return Malformed("invalid Content-Length");
      }
      if (contentLength && *contentLength != *length) {
        return Malformed("conflicting Content-Length values");
      }
      if (*length > maxBodyBytes) {
        return Malformed("Content-Length exceeds body limit");
      }
      contentLength = length;
    }

    head.headers.push_back(http::Header{std::string(name), std::string(value)});
  }

  head.method.assign(method);
  head.target.assign(target);
  head.version.assign(version);
  head.headLength = headLength;
  head.contentLength = contentLength.value_or(0);
  result.status = ParseResult::Status::Complete;
  return result;
}

}  // namespace hellonet
