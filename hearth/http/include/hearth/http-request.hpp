#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hearth/flat-hash-map.hpp"
#include "hearth/http-method.hpp"
#include "hearth/json.hpp"

namespace hearth {

// Normalized view of an HTTP request, as given to handlers.
//
// Header names are lower cased; repeated headers are joined with ", " in order of appearance.
// The query map is decoded, the path is not. The body is a JSON document: an empty object for GET and HEAD requests,
// for requests without body and for bodies that are not valid JSON.
class HttpRequest {
 public:
  using StringMap = flat_hash_map<std::string, std::string>;

  HttpRequest() : _body(EmptyJsonObject()) {}

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view methodStr() const noexcept { return http::MethodToStr(_method); }

  // Path part of the target, before the first '?'.
  [[nodiscard]] std::string_view path() const noexcept { return std::string_view(_originalUrl).substr(0, _pathLength); }

  // Raw request target as received (path and query string).
  [[nodiscard]] std::string_view originalUrl() const noexcept { return _originalUrl; }

  // "HTTP/1.0" or "HTTP/1.1"
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] const StringMap& headers() const noexcept { return _headers; }

  // Case-insensitive header lookup.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const;

  [[nodiscard]] const StringMap& query() const noexcept { return _query; }

  [[nodiscard]] std::optional<std::string_view> queryParamValue(std::string_view key) const;

  // Path parameters. Routes only match exact paths, so it is always empty.
  [[nodiscard]] const StringMap& params() const noexcept { return _params; }

  [[nodiscard]] const Json& body() const noexcept { return _body; }

  // Whether the client wants the connection to stay open after the response.
  [[nodiscard]] bool keepAlive() const noexcept { return _keepAlive; }

  void setBody(Json body) { _body = std::move(body); }

  // Makes this request reusable for the next one on the same connection.
  void reset();

 private:
  friend class RequestHeadParser;

  std::string _originalUrl;
  std::string_view _version;
  StringMap _headers;
  StringMap _query;
  StringMap _params;
  Json _body;
  std::string::size_type _pathLength{0};
  http::Method _method{http::Method::GET};
  bool _keepAlive{true};
};

}  // namespace hearth
