#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

#include "hearth/http-method.hpp"
#include "hearth/http-request.hpp"
#include "hearth/http-response-writer.hpp"
#include "hearth/http-server-config.hpp"
#include "hearth/router.hpp"
#include "hearth/test_server_fixture.hpp"
#include "hearth/test_util.hpp"

using namespace std::chrono_literals;
using namespace hearth;

namespace {

struct HealthStatus {
  std::string status;
};

void Health(const HttpRequest&, HttpResponseWriter& writer) { writer.send(HealthStatus{"healthy"}); }

Router MakeRouter() {
  Router router;
  router.get("/health", Health);
  router.setPath(http::Method::HEAD, "/health", Health);
  router.get("/query", [](const HttpRequest& req, HttpResponseWriter& writer) {
    writer.send(std::string(req.queryParamValue("a").value_or("<none>")));
  });
  router.get("/header", [](const HttpRequest& req, HttpResponseWriter& writer) {
    writer.status(http::StatusCodeAccepted)
        .setHeader("X-Echo", req.headerValue("x-custom").value_or(""))
        .send(std::string(req.path()));
  });
  router.post("/created", [](const HttpRequest&, HttpResponseWriter& writer) {
    writer.status(http::StatusCodeCreated).send(HealthStatus{"created"});
  });
  return router;
}

}  // namespace

TEST(HttpCore, HealthReturnsJson) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  test::RequestOptions opt;
  opt.target = "/health";
  const auto raw = test::request(ts.port(), opt);
  ASSERT_TRUE(raw);
  const auto parsed = test::parseResponse(*raw);
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->statusCode, 200);
  EXPECT_EQ(parsed->reason, "OK");
  EXPECT_EQ(parsed->body, R"({"status":"healthy"})");
  EXPECT_EQ(parsed->headers.at("Content-Type"), "application/json");
  EXPECT_EQ(parsed->headers.at("Content-Length"), "20");
  EXPECT_EQ(parsed->headers.at("Connection"), "close");
}

TEST(HttpCore, MissingRouteIsNotFound) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  test::RequestOptions opt;
  opt.target = "/missing";
  const auto parsed = test::parseResponse(test::request(ts.port(), opt).value_or(""));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->statusCode, 404);
  EXPECT_EQ(parsed->body, "Not Found");
  EXPECT_EQ(parsed->headers.at("Content-Type"), "text/plain");
}

TEST(HttpCore, DifferentMethodOnSamePathIsNotFound) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  test::RequestOptions opt;
  opt.method = "DELETE";
  opt.target = "/health";
  const auto parsed = test::parseResponse(test::request(ts.port(), opt).value_or(""));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->statusCode, 404);
}

TEST(HttpCore, HandlerStatusAndHeaders) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  test::RequestOptions opt;
  opt.target = "/header";
  opt.headers.emplace_back("X-Custom", "value");
  const auto parsed = test::parseResponse(test::request(ts.port(), opt).value_or(""));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->statusCode, 202);
  EXPECT_EQ(parsed->headers.at("X-Echo"), "value");
  EXPECT_EQ(parsed->body, R"("/header")");

  opt.method = "POST";
  opt.target = "/created";
  const auto created = test::parseResponse(test::request(ts.port(), opt).value_or(""));
  ASSERT_TRUE(created);
  EXPECT_EQ(created->statusCode, 201);
  EXPECT_EQ(created->body, R"({"status":"created"})");
}

TEST(HttpCore, QueryStringIsDecoded) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  test::RequestOptions opt;
  opt.target = "/query?a=hello%20world&b=2";
  auto parsed = test::parseResponse(test::request(ts.port(), opt).value_or(""));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->statusCode, 200);
  EXPECT_EQ(parsed->body, R"("hello world")");

  opt.target = "/query?a=1&a=2";
  parsed = test::parseResponse(test::request(ts.port(), opt).value_or(""));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->body, R"("2")");

  // Malformed escape drops the pair
  opt.target = "/query?a=%zz";
  parsed = test::parseResponse(test::request(ts.port(), opt).value_or(""));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->body, R"("<none>")");
}

TEST(HttpCore, KeepAliveConnectionServesSeveralRequests) {
  test::TestServer ts(HttpServerConfig{}.withKeepAliveTimeout(3s), MakeRouter());

  test::ClientConnection cnx(ts.port());
  test::RequestOptions opt;
  opt.target = "/health";
  opt.connection = "keep-alive";
  for (int requestNb = 0; requestNb < 3; ++requestNb) {
    ASSERT_TRUE(test::sendAll(cnx.fd(), test::buildRequest(opt)));
    const auto parsed = test::parseResponse(test::recvWithTimeout(cnx.fd()));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->statusCode, 200);
    EXPECT_EQ(parsed->headers.at("Connection"), "keep-alive");
    EXPECT_EQ(parsed->headers.at("Keep-Alive"), "timeout=3000");
  }
  EXPECT_EQ(ts.server.nbActiveConnections(), 1U);
}

TEST(HttpCore, PipelinedRequestsAreAnsweredInOrder) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  std::string raw;
  raw.append("GET /health HTTP/1.1\r\nHost: h\r\n\r\n");
  raw.append("GET /missing HTTP/1.1\r\nHost: h\r\n\r\n");
  raw.append("GET /query?a=x HTTP/1.1\r\nHost: h\r\nConnection: close\r\n\r\n");
  const auto responses = test::parseResponses(test::sendAndCollect(ts.port(), raw));
  ASSERT_EQ(responses.size(), 3U);
  EXPECT_EQ(responses[0].statusCode, 200);
  EXPECT_EQ(responses[1].statusCode, 404);
  EXPECT_EQ(responses[2].statusCode, 200);
  EXPECT_EQ(responses[2].body, R"("x")");
}

TEST(HttpCore, HeadOmitsBody) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  const auto raw = test::sendAndCollect(ts.port(), "HEAD /health HTTP/1.1\r\nHost: h\r\nConnection: close\r\n\r\n");
  EXPECT_TRUE(raw.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_TRUE(raw.contains("Content-Length: 20\r\n"));
  EXPECT_TRUE(raw.ends_with("\r\n\r\n"));

  const auto notFound =
      test::sendAndCollect(ts.port(), "HEAD /missing HTTP/1.1\r\nHost: h\r\nConnection: close\r\n\r\n");
  EXPECT_TRUE(notFound.starts_with("HTTP/1.1 404 Not Found\r\n"));
  EXPECT_TRUE(notFound.ends_with("\r\n\r\n"));
}

TEST(HttpCore, Http10ClosesByDefault) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  const auto raw = test::sendAndCollect(ts.port(), "GET /health HTTP/1.0\r\n\r\n");
  const auto parsed = test::parseResponse(raw);
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->statusCode, 200);
  EXPECT_EQ(parsed->headers.at("Connection"), "close");

  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /health HTTP/1.0\r\nConnection: keep-alive\r\n\r\n"));
  const auto keptAlive = test::parseResponse(test::recvWithTimeout(cnx.fd()));
  ASSERT_TRUE(keptAlive);
  EXPECT_EQ(keptAlive->headers.at("Connection"), "keep-alive");
}

TEST(HttpCore, RouteAndResponseCachesArePopulated) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());

  test::RequestOptions opt;
  opt.target = "/query?a=1";
  ASSERT_TRUE(test::request(ts.port(), opt));
  opt.target = "/query?a=2";
  ASSERT_TRUE(test::request(ts.port(), opt));
  opt.target = "/missing";
  ASSERT_TRUE(test::request(ts.port(), opt));
  ts.stop();

  EXPECT_TRUE(ts.server.router().isCached(http::Method::GET, "/query?a=1"));
  EXPECT_TRUE(ts.server.router().isCached(http::Method::GET, "/query?a=2"));
  EXPECT_FALSE(ts.server.router().isCached(http::Method::GET, "/missing"));
  EXPECT_EQ(ts.server.responseCache().size(), 2U);
  EXPECT_TRUE(ts.server.responseCache().contains("GET:/query?a=1"));
}

TEST(HttpCore, ServerCanBeRunAgainAfterStop) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());
  const auto port = ts.port();
  ts.stop();

  auto handle = ts.server.startDetached();
  EXPECT_TRUE(handle.started());
  EXPECT_EQ(ts.server.port(), port);

  test::RequestOptions opt;
  opt.target = "/health";
  const auto parsed = test::parseResponse(test::request(port, opt).value_or(""));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->statusCode, 200);

  handle.stop();
  EXPECT_NO_THROW(handle.rethrowIfError());
}

TEST(HttpCore, RunningTwiceThrows) {
  test::TestServer ts(HttpServerConfig{}, MakeRouter());
  ASSERT_TRUE(ts.server.isRunning());
  EXPECT_THROW(ts.server.run(), std::logic_error);
}
