#include "hearth/static-response.hpp"

#include <gtest/gtest.h>

#include <string>

#include "hearth/http-status-code.hpp"

namespace hearth {

TEST(StaticResponse, NotFound) {
  EXPECT_EQ(BuildStaticResponse(http::StatusCodeNotFound, "Not Found", true),
            "HTTP/1.1 404 Not Found\r\n"
            "Content-Type: text/plain\r\n"
            "Content-Length: 9\r\n"
            "Connection: keep-alive\r\n"
            "\r\n"
            "Not Found");
}

TEST(StaticResponse, ShuttingDownCloses) {
  EXPECT_EQ(BuildStaticResponse(http::StatusCodeServiceUnavailable, "Server is shutting down", false),
            "HTTP/1.1 503 Service Unavailable\r\n"
            "Content-Type: text/plain\r\n"
            "Content-Length: 23\r\n"
            "Connection: close\r\n"
            "\r\n"
            "Server is shutting down");
}

TEST(StaticResponse, HeadOmitsBodyButKeepsContentLength) {
  EXPECT_EQ(BuildStaticResponse(http::StatusCodeInternalServerError, "Internal Server Error", true, true),
            "HTTP/1.1 500 Internal Server Error\r\n"
            "Content-Type: text/plain\r\n"
            "Content-Length: 21\r\n"
            "Connection: keep-alive\r\n"
            "\r\n");
}

TEST(StaticResponse, AppendHelpers) {
  std::string out;
  AppendStatusLine(out, http::StatusCodeRequestHeaderFieldsTooLarge);
  AppendHeader(out, "X-A", "b");
  EXPECT_EQ(out, "HTTP/1.1 431 Request Header Fields Too Large\r\nX-A: b\r\n");
}

}  // namespace hearth
