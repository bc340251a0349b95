#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include "hearth/http-status-code.hpp"
#include "hearth/json.hpp"
#include "hearth/response-cache.hpp"
#include "hearth/vector.hpp"

namespace hearth {

// Handle given to request handlers to build and emit their response.
//
// The status code defaults to 200. send() serializes its argument to JSON and emits the whole response exactly once;
// calls to send() after the first one are ignored (and logged as errors).
//
// Usage example:
//   router.post("/items", [](const HttpRequest& req, HttpResponseWriter& writer) {
//     writer.status(http::StatusCodeCreated).setHeader("X-Item-Count", "1").send(req.body());
//   });
class HttpResponseWriter {
 public:
  struct Context {
    // Body is omitted from the wire for HEAD requests (headers are unchanged).
    bool headRequest{false};
    // Whether the connection stays open after this response.
    bool keepAlive{true};
    std::chrono::milliseconds keepAliveTimeout{5000};
    // Successful (200) serialized bodies are stored in this cache under 'cacheKey', if not null.
    ResponseCache* pResponseCache{nullptr};
    std::string_view cacheKey;
  };

  // Response bytes are appended to 'out'.
  HttpResponseWriter(std::string& out, Context context) noexcept : _out(out), _context(context) {}

  HttpResponseWriter(const HttpResponseWriter&) = delete;
  HttpResponseWriter(HttpResponseWriter&&) = delete;
  HttpResponseWriter& operator=(const HttpResponseWriter&) = delete;
  HttpResponseWriter& operator=(HttpResponseWriter&&) = delete;

  ~HttpResponseWriter() = default;

  // Sets the status code of the response. Throws std::invalid_argument if not in [100, 599].
  HttpResponseWriter& status(http::StatusCode statusCode);

  // Sets a response header, replacing any existing header with the same (case-insensitive) name.
  // Content-Type defaults to application/json but can be overridden. Framing headers (Content-Length, Connection,
  // Keep-Alive, Transfer-Encoding) are managed by the server and cannot be set.
  // Throws std::invalid_argument for an invalid or reserved name, or a value containing CR, LF or NUL.
  HttpResponseWriter& setHeader(std::string_view name, std::string_view value);

  // Serializes 'body' to JSON (glz::json_t or any type glaze can serialize) and emits the response.
  template <class T>
  void send(const T& body) {
    sendSerialized(SerializeToJson(body));
  }

  // Whether send() has been called.
  [[nodiscard]] bool sent() const noexcept { return _sent; }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  // Value of a header previously set with setHeader(), or empty if not set.
  [[nodiscard]] std::string_view headerValue(std::string_view name) const noexcept;

 private:
  void sendSerialized(std::string body);

  std::string& _out;
  Context _context;
  vector<std::pair<std::string, std::string>> _headers;
  http::StatusCode _statusCode{http::StatusCodeOK};
  bool _sent{false};
};

}  // namespace hearth
