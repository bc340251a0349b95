#include "hearth/http-response-writer.hpp"

#include <format>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "hearth/http-constants.hpp"
#include "hearth/http-status-code.hpp"
#include "hearth/http-token.hpp"
#include "hearth/log.hpp"
#include "hearth/static-response.hpp"
#include "hearth/string-equal-ignore-case.hpp"

namespace hearth {

namespace {

bool IsReservedHeader(std::string_view name) {
  return CaseInsensitiveEqual(name, http::ContentLength) || CaseInsensitiveEqual(name, http::Connection) ||
         CaseInsensitiveEqual(name, http::KeepAlive) || CaseInsensitiveEqual(name, http::TransferEncoding);
}

}  // namespace

HttpResponseWriter& HttpResponseWriter::status(http::StatusCode statusCode) {
  if (!http::IsValidStatusCode(statusCode)) {
    throw std::invalid_argument(std::format("Invalid HTTP status code {}", statusCode));
  }
  if (_sent) {
    log::warn("Ignoring status {} set after the response was sent", statusCode);
  } else {
    _statusCode = statusCode;
  }
  return *this;
}

HttpResponseWriter& HttpResponseWriter::setHeader(std::string_view name, std::string_view value) {
  if (!http::IsToken(name)) {
    throw std::invalid_argument(std::format("Invalid header name '{}'", name));
  }
  if (IsReservedHeader(name)) {
    throw std::invalid_argument(std::format("Header '{}' is managed by the server", name));
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument(std::format("Invalid value for header '{}'", name));
  }
  for (auto& [headerName, headerValue] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      headerValue.assign(value);
      return *this;
    }
  }
  _headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

std::string_view HttpResponseWriter::headerValue(std::string_view name) const noexcept {
  for (const auto& [headerName, headerValue] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return headerValue;
    }
  }
  return {};
}

void HttpResponseWriter::sendSerialized(std::string body) {
  if (_sent) {
    log::error("Response already sent, ignoring subsequent send");
    return;
  }
  _sent = true;
  if (body.empty()) {
    log::error("Unable to serialize response body to JSON");
    _statusCode = http::StatusCodeInternalServerError;
    _out.append(BuildStaticResponse(_statusCode, http::ReasonPhraseFor(_statusCode), _context.keepAlive,
                                    _context.headRequest));
    return;
  }

  if (_statusCode == http::StatusCodeOK && _context.pResponseCache != nullptr && !_context.cacheKey.empty()) {
    _context.pResponseCache->insert(std::string(_context.cacheKey), body);
  }

  AppendStatusLine(_out, _statusCode);
  bool hasContentType = false;
  for (const auto& [name, value] : _headers) {
    hasContentType = hasContentType || CaseInsensitiveEqual(name, http::ContentType);
    AppendHeader(_out, name, value);
  }
  if (!hasContentType) {
    AppendHeader(_out, http::ContentType, http::ContentTypeApplicationJson);
  }
  AppendHeader(_out, http::ContentLength, std::to_string(body.size()));
  if (_context.keepAlive) {
    AppendHeader(_out, http::Connection, http::kKeepAlive);
    _out.append(http::KeepAlive).append(http::HeaderSep);
    std::format_to(std::back_inserter(_out), "timeout={}{}", _context.keepAliveTimeout.count(), http::CRLF);
  } else {
    AppendHeader(_out, http::Connection, http::kClose);
  }
  _out.append(http::CRLF);
  if (!_context.headRequest) {
    _out.append(body);
  }
}

}  // namespace hearth
