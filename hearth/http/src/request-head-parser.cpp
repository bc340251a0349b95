#include "hearth/request-head-parser.hpp"

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

#include "hearth/http-constants.hpp"
#include "hearth/http-method.hpp"
#include "hearth/http-request.hpp"
#include "hearth/http-status-code.hpp"
#include "hearth/http-token.hpp"
#include "hearth/log.hpp"
#include "hearth/query-string.hpp"
#include "hearth/string-equal-ignore-case.hpp"

namespace hearth {

namespace {

using Result = RequestHeadParser::Result;

constexpr Result Error(http::StatusCode statusCode) {
  return Result{Result::Status::Error, statusCode, 0, BodyFraming::None, 0};
}

constexpr bool IsValidTarget(std::string_view target) {
  if (target.empty() || (target.front() != '/' && target != "*")) {
    return false;
  }
  for (char ch : target) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte <= 0x20U || byte == 0x7FU) {
      return false;
    }
  }
  return true;
}

constexpr std::string_view TrimOws(std::string_view str) {
  while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
    str.remove_prefix(1);
  }
  while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
    str.remove_suffix(1);
  }
  return str;
}

// Returns the last element of a comma separated list, trimmed.
constexpr std::string_view LastListElement(std::string_view list) {
  const auto lastComma = list.rfind(',');
  return TrimOws(lastComma == std::string_view::npos ? list : list.substr(lastComma + 1));
}

}  // namespace

RequestHeadParser::Result RequestHeadParser::parse(std::string_view data, HttpRequest& request) const {
  // Tolerate empty lines preceding the request line.
  std::size_t offset = 0;
  while (data.substr(offset, http::CRLF.size()) == http::CRLF) {
    offset += http::CRLF.size();
  }

  const auto headEndPos = data.find(http::DoubleCRLF, offset);
  if (headEndPos == std::string_view::npos) {
    if (data.size() - offset > _maxHeaderBytes) {
      return Error(http::StatusCodeRequestHeaderFieldsTooLarge);
    }
    return {};
  }
  const std::size_t headLength = headEndPos + http::DoubleCRLF.size();
  if (headLength - offset > _maxHeaderBytes) {
    return Error(http::StatusCodeRequestHeaderFieldsTooLarge);
  }

  // Request line: METHOD SP target SP HTTP-version
  const std::string_view head = data.substr(offset, headEndPos + http::CRLF.size() - offset);
  const auto requestLineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, requestLineEnd);

  const auto firstSpace = requestLine.find(' ');
  const auto lastSpace = requestLine.rfind(' ');
  if (firstSpace == std::string_view::npos || firstSpace == lastSpace) {
    log::debug("Malformed request line '{}'", requestLine);
    return Error(http::StatusCodeBadRequest);
  }
  const std::string_view methodStr = requestLine.substr(0, firstSpace);
  const std::string_view target = requestLine.substr(firstSpace + 1, lastSpace - firstSpace - 1);
  const std::string_view versionStr = requestLine.substr(lastSpace + 1);

  std::string_view version;
  if (versionStr == http::HTTP11Sv) {
    version = http::HTTP11Sv;
  } else if (versionStr == http::HTTP10Sv) {
    version = http::HTTP10Sv;
  } else if (versionStr.size() == http::HTTP11Sv.size() && versionStr.starts_with("HTTP/") && versionStr[6] == '.') {
    return Error(http::StatusCodeHTTPVersionNotSupported);
  } else {
    return Error(http::StatusCodeBadRequest);
  }

  if (!http::IsToken(methodStr)) {
    return Error(http::StatusCodeBadRequest);
  }
  const auto optMethod = http::MethodFromStr(methodStr);
  if (!optMethod) {
    log::debug("Unsupported method '{}'", methodStr);
    return Error(http::StatusCodeNotImplemented);
  }
  if (!IsValidTarget(target)) {
    log::debug("Invalid request target '{}'", target);
    return Error(http::StatusCodeBadRequest);
  }

  request.reset();
  request._method = *optMethod;
  request._version = version;
  request._originalUrl.assign(target);
  const auto split = SplitTarget(target);
  request._pathLength = split.path.size();
  if (split.hasQuery) {
    ParseQueryString(split.queryString, request._query);
  }

  // Header fields
  std::string_view fields = head.substr(requestLineEnd + http::CRLF.size());
  std::string name;
  while (!fields.empty()) {
    const auto lineEnd = fields.find(http::CRLF);
    const std::string_view line = fields.substr(0, lineEnd);
    fields.remove_prefix(lineEnd + http::CRLF.size());

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || !http::IsToken(line.substr(0, colonPos))) {
      // Also rejects obsolete line folding (line starting with a space or tab)
      log::debug("Malformed header line '{}'", line);
      return Error(http::StatusCodeBadRequest);
    }
    name = ToLowerCopy(line.substr(0, colonPos));
    const std::string_view value = TrimOws(line.substr(colonPos + 1));

    auto it = request._headers.find(name);
    if (it == request._headers.end()) {
      request._headers.emplace(name, std::string(value));
    } else {
      it->second.append(", ").append(value);
    }
  }

  // Connection persistence: HTTP/1.1 defaults to keep-alive, HTTP/1.0 to close.
  const auto connection = request.headerValue(http::Connection);
  if (version == http::HTTP11Sv) {
    request._keepAlive = !connection || !ContainsTokenIgnoreCase(*connection, http::kClose);
  } else {
    request._keepAlive = connection && ContainsTokenIgnoreCase(*connection, http::kKeepAlive);
  }

  Result result{Result::Status::Ok, 0, headLength, BodyFraming::None, 0};

  const auto transferEncoding = request.headerValue(http::TransferEncoding);
  const auto contentLength = request.headerValue(http::ContentLength);
  if (transferEncoding) {
    if (contentLength) {
      log::debug("Request has both Transfer-Encoding and Content-Length");
      return Error(http::StatusCodeBadRequest);
    }
    if (!CaseInsensitiveEqual(LastListElement(*transferEncoding), http::kChunked)) {
      log::debug("Unsupported Transfer-Encoding '{}'", *transferEncoding);
      return Error(http::StatusCodeNotImplemented);
    }
    result.framing = BodyFraming::Chunked;
  } else if (contentLength) {
    const char* first = contentLength->data();
    const char* last = first + contentLength->size();
    const auto [ptr, ec] = std::from_chars(first, last, result.contentLength);
    if (ec != std::errc{} || ptr != last || contentLength->empty()) {
      log::debug("Invalid Content-Length '{}'", *contentLength);
      return Error(http::StatusCodeBadRequest);
    }
    if (result.contentLength != 0) {
      result.framing = BodyFraming::ContentLength;
    }
  }
  return result;
}

}  // namespace hearth
