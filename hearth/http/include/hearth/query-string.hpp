#pragma once

#include <string>
#include <string_view>

#include "hearth/flat-hash-map.hpp"

namespace hearth {

struct SplitTargetResult {
  std::string_view path;
  std::string_view queryString;  // after the first '?', not decoded
  bool hasQuery{false};
};

// Splits a raw request target at its first '?'.
[[nodiscard]] constexpr SplitTargetResult SplitTarget(std::string_view target) noexcept {
  const auto queryPos = target.find('?');
  if (queryPos == std::string_view::npos) {
    return {target, {}, false};
  }
  return {target.substr(0, queryPos), target.substr(queryPos + 1), true};
}

// Parses a query string ("a=1&b=%20x") into 'out', with these rules:
//  - pairs are separated by '&', a key without '=' gets an empty value,
//  - a pair with an empty key is skipped,
//  - keys and values are percent-decoded, '+' is kept as is,
//  - a pair whose key or value fails to decode (bad escape, invalid UTF-8) is dropped,
//  - when a key appears several times, the last value wins.
void ParseQueryString(std::string_view queryString, flat_hash_map<std::string, std::string>& out);

}  // namespace hearth
