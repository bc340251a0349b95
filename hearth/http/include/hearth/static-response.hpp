#pragma once

#include <string>
#include <string_view>

#include "hearth/http-status-code.hpp"

namespace hearth {

// Builds a complete plain text response, for responses emitted by the server itself (404, 408, 500, 503, ...).
// 'message' is the body. The Connection header is 'keep-alive' or 'close' according to 'keepAlive'.
// If 'omitBody' is set (HEAD requests), Content-Length still advertises 'message' but the body is not appended.
[[nodiscard]] std::string BuildStaticResponse(http::StatusCode statusCode, std::string_view message, bool keepAlive,
                                              bool omitBody = false);

// Appends the status line "HTTP/1.1 <code> <reason>\r\n" to 'out'.
void AppendStatusLine(std::string& out, http::StatusCode statusCode);

// Appends a "<name>: <value>\r\n" header line to 'out'.
void AppendHeader(std::string& out, std::string_view name, std::string_view value);

}  // namespace hearth
