#include "hearth/http-request.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "hearth/json.hpp"
#include "hearth/string-equal-ignore-case.hpp"

namespace hearth {

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const {
  auto it = _headers.find(ToLowerCopy(name));
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::optional<std::string_view> HttpRequest::queryParamValue(std::string_view key) const {
  auto it = _query.find(std::string(key));
  if (it == _query.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

void HttpRequest::reset() {
  _originalUrl.clear();
  _version = {};
  _headers.clear();
  _query.clear();
  _body = EmptyJsonObject();
  _pathLength = 0;
  _method = http::Method::GET;
  _keepAlive = true;
}

}  // namespace hearth
