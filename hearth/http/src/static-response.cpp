#include "hearth/static-response.hpp"

#include <format>
#include <iterator>
#include <string>
#include <string_view>

#include "hearth/http-constants.hpp"
#include "hearth/http-status-code.hpp"

namespace hearth {

void AppendStatusLine(std::string& out, http::StatusCode statusCode) {
  std::format_to(std::back_inserter(out), "{} {} {}{}", http::HTTP11Sv, statusCode, http::ReasonPhraseFor(statusCode),
                 http::CRLF);
}

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
}

std::string BuildStaticResponse(http::StatusCode statusCode, std::string_view message, bool keepAlive,
                                bool omitBody) {
  std::string out;
  out.reserve(128U + message.size());
  AppendStatusLine(out, statusCode);
  AppendHeader(out, http::ContentType, http::ContentTypeTextPlain);
  AppendHeader(out, http::ContentLength, std::to_string(message.size()));
  AppendHeader(out, http::Connection, keepAlive ? http::kKeepAlive : http::kClose);
  out.append(http::CRLF);
  if (!omitBody) {
    out.append(message);
  }
  return out;
}

}  // namespace hearth
