#include "hearth/query-string.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "hearth/flat-hash-map.hpp"
#include "hearth/log.hpp"
#include "hearth/url-decode.hpp"

namespace hearth {

void ParseQueryString(std::string_view queryString, flat_hash_map<std::string, std::string>& out) {
  const std::size_t len = queryString.size();
  std::size_t start = 0;
  std::size_t pos = 0;
  std::string key;
  std::string value;
  while (pos < len) {
    while (pos < len && queryString[pos] != '=' && queryString[pos] != '&') {
      ++pos;
    }
    const std::string_view rawKey = queryString.substr(start, pos - start);
    if (rawKey.empty()) {
      start = ++pos;
      continue;
    }
    std::string_view rawValue;
    if (pos < len && queryString[pos] == '=') {
      start = ++pos;
      while (pos < len && queryString[pos] != '&') {
        ++pos;
      }
      rawValue = queryString.substr(start, pos - start);
    }
    if (url::DecodeComponent(rawKey, key) && url::DecodeComponent(rawValue, value)) {
      out[key] = value;
    } else {
      log::debug("Dropping query parameter '{}' that cannot be decoded", rawKey);
    }
    start = ++pos;
  }
}

}  // namespace hearth
