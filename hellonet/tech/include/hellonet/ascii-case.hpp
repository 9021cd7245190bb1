#pragma once

#include <string>

namespace hellonet {

// ASCII only case mapping, independent from the C locale. HTTP tokens (methods, header names) are ASCII.

constexpr bool IsUpperAscii(char ch) noexcept { return ch >= 'A' && ch <= 'Z'; }

constexpr bool IsLowerAscii(char ch) noexcept { return ch >= 'a' && ch <= 'z'; }

constexpr char ToLowerAscii(char ch) noexcept { return IsUpperAscii(ch) ? static_cast<char>(ch + ('a' - 'A')) : ch; }

constexpr char ToUpperAscii(char ch) noexcept { return IsLowerAscii(ch) ? static_cast<char>(ch - ('a' - 'A')) : ch; }

inline void ToUpperAsciiInPlace(std::string& str) noexcept {
  for (char& ch : str) {
    ch = ToUpperAscii(ch);
  }
}

}  // namespace hellonet
