#pragma once

#include <string_view>

namespace hellonet::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// HTTP header field names are case-insensitive per RFC 7230. We store them here
// in their conventional canonical form for emission. Comparison in parsing code
// remains case-insensitive (CaseInsensitiveEqual).

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard Header Field Names
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";

// Header values
inline constexpr std::string_view close = "close";
inline constexpr std::string_view keepalive = "keep-alive";

inline constexpr std::string_view ContentTypeTextPlainUtf8 = "text/plain; charset=utf-8";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Raw reply written on connections whose request cannot be parsed, right before closing them.
inline constexpr std::string_view BadRequestReply = "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";

}  // namespace hellonet::http
