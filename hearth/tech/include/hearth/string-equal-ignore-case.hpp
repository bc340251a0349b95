#pragma once

#include <string>
#include <string_view>

#include "hearth/toupperlower.hpp"

namespace hearth {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

// Returns a lower case copy of given ASCII string. Non ASCII bytes are kept untouched.
inline std::string ToLowerCopy(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = tolower(ch);
  }
  return ret;
}

// Tells whether the comma separated token list 'value' contains 'token' (case insensitive, surrounding OWS ignored).
// Used for headers like 'Connection: keep-alive, Upgrade'.
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

}  // namespace hearth
