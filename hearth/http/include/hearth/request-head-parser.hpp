#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "hearth/http-status-code.hpp"

namespace hearth {

class HttpRequest;

enum class BodyFraming : uint8_t { None, ContentLength, Chunked };

// Parses HTTP/1.x request heads (request line, header fields, terminating empty line).
class RequestHeadParser {
 public:
  struct Result {
    enum class Status : uint8_t { NeedMore, Ok, Error };

    Status status{Status::NeedMore};
    // Status code to answer with when status is Error (400, 431, 501, 505).
    http::StatusCode errorCode{0};
    // Number of bytes of the head, including the final CRLFCRLF, when status is Ok.
    std::size_t headLength{0};
    BodyFraming framing{BodyFraming::None};
    // Announced body length, when framing is ContentLength.
    std::size_t contentLength{0};
  };

  explicit RequestHeadParser(std::size_t maxHeaderBytes) noexcept : _maxHeaderBytes(maxHeaderBytes) {}

  // Parses the request head at the beginning of 'data'. On success, 'request' is reset and filled with the method,
  // target, version, headers, query and keep-alive intent of the request. Its body is left empty.
  // A head larger than maxHeaderBytes is an error (431), whether complete or not.
  [[nodiscard]] Result parse(std::string_view data, HttpRequest& request) const;

 private:
  std::size_t _maxHeaderBytes;
};

}  // namespace hearth
