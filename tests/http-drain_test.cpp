#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "hearth/http-request.hpp"
#include "hearth/http-response-writer.hpp"
#include "hearth/http-server-config.hpp"
#include "hearth/http-server.hpp"
#include "hearth/router.hpp"
#include "hearth/test_server_fixture.hpp"
#include "hearth/test_util.hpp"

using namespace std::chrono_literals;
using namespace hearth;

namespace {

struct DrainTarget {
  std::atomic<HttpServer*> pServer{nullptr};
};

Router MakeRouter(DrainTarget& target) {
  Router router;
  router.get("/ok", [](const HttpRequest&, HttpResponseWriter& writer) { writer.send(std::string("ok")); });
  router.get("/drain", [&target](const HttpRequest&, HttpResponseWriter& writer) {
    target.pServer.load()->beginDrain();
    writer.send(std::string("draining"));
  });
  return router;
}

test::RequestOptions KeepAliveGet(std::string target) {
  test::RequestOptions opt;
  opt.target = std::move(target);
  opt.connection = "keep-alive";
  return opt;
}

}  // namespace

TEST(HttpDrain, IdleServerDrainsImmediately) {
  DrainTarget target;
  test::TestServer ts(HttpServerConfig{}, MakeRouter(target));

  ts.server.beginDrain();
  EXPECT_TRUE(ts.waitLoopExit(1s));
  EXPECT_FALSE(ts.server.isDraining());
  EXPECT_TRUE(test::WaitForListenerClosed(ts.port(), 500ms));
}

TEST(HttpDrain, WaitsForClientToCloseIdleConnection) {
  DrainTarget target;
  test::TestServer ts(HttpServerConfig{}, MakeRouter(target));

  auto cnx = std::make_unique<test::ClientConnection>(ts.port());
  ASSERT_TRUE(test::sendAll(cnx->fd(), test::buildRequest(KeepAliveGet("/ok"))));
  const auto resp = test::parseResponse(test::recvWithTimeout(cnx->fd()));
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->statusCode, 200);

  ts.server.beginDrain();
  EXPECT_TRUE(test::WaitForListenerClosed(ts.port(), 1s));
  // The idle connection is half closed: the client reads EOF
  EXPECT_TRUE(test::WaitForPeerClose(cnx->fd(), 1s));
  // but the server keeps running until the client closes its side.
  EXPECT_FALSE(ts.waitLoopExit(100ms));
  EXPECT_TRUE(ts.server.isDraining());

  cnx.reset();
  EXPECT_TRUE(ts.waitLoopExit(1s));
}

TEST(HttpDrain, RequestsReceivedWhileDrainingAreRejected) {
  DrainTarget target;
  test::TestServer ts(HttpServerConfig{}, MakeRouter(target));
  target.pServer.store(&ts.server);

  std::string raw = test::buildRequest(KeepAliveGet("/drain"));
  raw.append(test::buildRequest(KeepAliveGet("/ok")));
  const auto responses = test::parseResponses(test::sendAndCollect(ts.port(), raw));
  ASSERT_EQ(responses.size(), 2U);
  EXPECT_EQ(responses[0].statusCode, 200);
  EXPECT_EQ(responses[0].body, R"("draining")");
  EXPECT_EQ(responses[1].statusCode, 503);
  EXPECT_EQ(responses[1].body, "Server is shutting down");
  EXPECT_EQ(responses[1].headers.at("Connection"), "close");

  EXPECT_TRUE(ts.waitLoopExit(1s));
}

TEST(HttpDrain, RequestCompletedAfterDrainStartIsRejected) {
  DrainTarget target;
  test::TestServer ts(HttpServerConfig{}, MakeRouter(target));

  test::ClientConnection cnx(ts.port());
  const std::string request = test::buildRequest(KeepAliveGet("/ok"));
  ASSERT_TRUE(test::sendAll(cnx.fd(), std::string_view(request).substr(0, 10)));
  std::this_thread::sleep_for(30ms);

  ts.server.beginDrain();
  EXPECT_TRUE(test::WaitForListenerClosed(ts.port(), 1s));

  ASSERT_TRUE(test::sendAll(cnx.fd(), std::string_view(request).substr(10)));
  const auto resp = test::parseResponse(test::recvWithTimeout(cnx.fd()));
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->statusCode, 503);
  EXPECT_EQ(resp->body, "Server is shutting down");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
  EXPECT_TRUE(ts.waitLoopExit(1s));
}

TEST(HttpDrain, DeadlineForcesConnectionsClosed) {
  DrainTarget target;
  test::TestServer ts(HttpServerConfig{}, MakeRouter(target));

  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /ok HTTP/1.1\r\nHo"));
  std::this_thread::sleep_for(30ms);

  const auto before = std::chrono::steady_clock::now();
  ts.server.beginDrain(100ms);
  EXPECT_TRUE(ts.waitLoopExit(2s));
  EXPECT_GE(std::chrono::steady_clock::now() - before, 90ms);
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}

TEST(HttpDrain, SecondCallShortensDeadline) {
  DrainTarget target;
  test::TestServer ts(HttpServerConfig{}, MakeRouter(target));

  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /ok HTTP/1.1\r\nHo"));
  std::this_thread::sleep_for(30ms);

  ts.server.beginDrain(10s);
  ts.server.beginDrain(50ms);
  EXPECT_TRUE(ts.waitLoopExit(2s));
}

TEST(HttpDrain, StopClosesEverythingImmediately) {
  DrainTarget target;
  test::TestServer ts(HttpServerConfig{}, MakeRouter(target));

  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /ok HTTP/1.1\r\nHo"));
  std::this_thread::sleep_for(30ms);

  ts.server.stop();
  EXPECT_TRUE(ts.waitLoopExit(1s));
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
  EXPECT_TRUE(test::WaitForListenerClosed(ts.port(), 500ms));
}

TEST(HttpDrain, ServerCanRunAgainAfterDrain) {
  DrainTarget target;
  test::TestServer ts(HttpServerConfig{}, MakeRouter(target));
  const auto port = ts.port();

  ts.server.beginDrain();
  ASSERT_TRUE(ts.waitLoopExit(1s));

  auto handle = ts.server.startDetached();
  test::RequestOptions opt;
  opt.target = "/ok";
  const auto resp = test::parseResponse(test::request(port, opt).value_or(""));
  ASSERT_TRUE(resp);
  EXPECT_EQ(resp->statusCode, 200);
  handle.stop();
  EXPECT_NO_THROW(handle.rethrowIfError());
}
