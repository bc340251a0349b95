#pragma once

#include <string_view>

namespace hearth::http {

// Header field names are case-insensitive. They are stored here in their canonical form for emission; request
// headers are stored lower cased once parsed.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view KeepAlive = "Keep-Alive";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";

inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

inline constexpr std::string_view kClose = "close";
inline constexpr std::string_view kKeepAlive = "keep-alive";
inline constexpr std::string_view kChunked = "chunked";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

}  // namespace hearth::http
