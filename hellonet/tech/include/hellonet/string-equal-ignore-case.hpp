#pragma once

#include <string_view>

#include "hellonet/ascii-case.hpp"

namespace hellonet {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (ToLowerAscii(*pLhs) != ToLowerAscii(*pRhs)) {
      return false;
    }
  }
  return true;
}

// Returns true if the comma separated token list 'value' contains 'token' (case-insensitive, OWS tolerant).
// Example: ContainsTokenIgnoreCase("Upgrade, Keep-Alive", "keep-alive") == true
constexpr bool ContainsTokenIgnoreCase(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    std::string_view item = value.substr(0, commaPos);
    while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
      item.remove_prefix(1);
    }
    while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) {
      item.remove_suffix(1);
    }
    if (CaseInsensitiveEqual(item, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace hellonet
