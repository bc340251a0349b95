#pragma once

#include <string_view>

namespace hearth::http {

// tchar as defined by RFC 9110 5.6.2
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
}

// Tells whether given string is a non-empty token (valid method or header field name).
constexpr bool IsToken(std::string_view str) noexcept {
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

// Tells whether given string can be emitted as a header field value (no CR, LF or NUL).
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  return value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos;
}

}  // namespace hearth::http
