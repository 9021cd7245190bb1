#pragma once

#include <string>
#include <string_view>

namespace hellonet::http {

// A single HTTP header field, as received or as emitted.
struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

// RFC 7230 §3.2: header field values can be preceded and followed by optional whitespace (OWS).
constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// RFC 7230 §3.2.6 token character.
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

// Validates that 'str' is a non-empty token (method names, header names).
constexpr bool IsValidToken(std::string_view str) noexcept {
  if (str.empty()) {
    return false;
  }
  for (char ch : str) {
    if (!IsTokenChar(ch)) {
      return false;
    }
  }
  return true;
}

constexpr bool IsValidHeaderName(std::string_view name) noexcept { return IsValidToken(name); }

// Header values must not contain CR, LF or NUL. The empty value is allowed.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  for (char ch : value) {
    if (ch == '\r' || ch == '\n' || ch == '\0') {
      return false;
    }
  }
  return true;
}

}  // namespace hellonet::http
