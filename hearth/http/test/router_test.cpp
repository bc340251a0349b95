#include "hearth/router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "hearth/http-method.hpp"
#include "hearth/http-request.hpp"
#include "hearth/http-response-writer.hpp"

namespace hearth {

class RouterTest : public ::testing::Test {
 protected:
  // Invokes handler and returns the value it was registered with (see Tag).
  static int call(const Router::Handler* pHandler) {
    HttpRequest request;
    std::string out;
    HttpResponseWriter writer(out, {});
    (*pHandler)(request, writer);
    return writer.statusCode();
  }

  // Handler that answers with given status, so that tests can tell handlers apart.
  static Router::Handler Tag(http::StatusCode statusCode) {
    return [statusCode](const HttpRequest&, HttpResponseWriter& writer) { writer.status(statusCode); };
  }

  Router router;
};

TEST_F(RouterTest, RegisterAndResolve) {
  router.get("/health", Tag(200)).post("/items", Tag(201)).put("/items", Tag(202)).del("/items", Tag(204));
  EXPECT_EQ(router.nbRoutes(), 4U);

  ASSERT_NE(router.resolve(http::Method::GET, "/health"), nullptr);
  EXPECT_EQ(call(router.resolve(http::Method::GET, "/health")), 200);
  EXPECT_EQ(call(router.resolve(http::Method::POST, "/items")), 201);
  EXPECT_EQ(call(router.resolve(http::Method::PUT, "/items")), 202);
  EXPECT_EQ(call(router.resolve(http::Method::DELETE, "/items")), 204);
}

TEST_F(RouterTest, DifferentMethodOnSamePathIsNotFound) {
  router.get("/health", Tag(200));
  EXPECT_EQ(router.resolve(http::Method::POST, "/health"), nullptr);
  EXPECT_EQ(router.resolve(http::Method::HEAD, "/health"), nullptr);
  EXPECT_EQ(router.cacheSize(), 0U);
}

TEST_F(RouterTest, MatchIsExactAndCaseSensitive) {
  router.get("/health", Tag(200));
  EXPECT_EQ(router.resolve(http::Method::GET, "/Health"), nullptr);
  EXPECT_EQ(router.resolve(http::Method::GET, "/health/"), nullptr);
  EXPECT_EQ(router.resolve(http::Method::GET, "/healthz"), nullptr);
  EXPECT_EQ(router.resolve(http::Method::GET, "/"), nullptr);
}

TEST_F(RouterTest, ReRegisteringOverwrites) {
  router.get("/a", Tag(200));
  router.get("/a", Tag(299));
  EXPECT_EQ(router.nbRoutes(), 1U);
  EXPECT_EQ(call(router.resolve(http::Method::GET, "/a")), 299);
}

TEST_F(RouterTest, QueryStringIsIgnoredForMatching) {
  router.get("/search", Tag(200));
  const auto* pHandler = router.resolve(http::Method::GET, "/search?q=1");
  ASSERT_NE(pHandler, nullptr);
  EXPECT_EQ(pHandler, router.resolve(http::Method::GET, "/search"));
  EXPECT_EQ(router.resolve(http::Method::GET, "/other?q=1"), nullptr);
}

TEST_F(RouterTest, EachDistinctTargetCreatesCacheEntry) {
  router.get("/search", Tag(200));
  EXPECT_FALSE(router.isCached(http::Method::GET, "/search?q=1"));
  ASSERT_NE(router.resolve(http::Method::GET, "/search?q=1"), nullptr);
  EXPECT_TRUE(router.isCached(http::Method::GET, "/search?q=1"));
  EXPECT_EQ(router.cacheSize(), 1U);

  ASSERT_NE(router.resolve(http::Method::GET, "/search?q=1"), nullptr);
  EXPECT_EQ(router.cacheSize(), 1U);

  ASSERT_NE(router.resolve(http::Method::GET, "/search?q=2"), nullptr);
  ASSERT_NE(router.resolve(http::Method::GET, "/search"), nullptr);
  EXPECT_EQ(router.cacheSize(), 3U);
  EXPECT_TRUE(router.isCached(http::Method::GET, "/search"));
}

TEST_F(RouterTest, CacheIsBounded) {
  router.setCacheCapacity(2);
  router.get("/search", Tag(200));
  for (int idx = 0; idx < 10; ++idx) {
    ASSERT_NE(router.resolve(http::Method::GET, "/search?page=" + std::to_string(idx)), nullptr);
  }
  EXPECT_EQ(router.cacheSize(), 2U);
  EXPECT_TRUE(router.isCached(http::Method::GET, "/search?page=9"));
  EXPECT_TRUE(router.isCached(http::Method::GET, "/search?page=8"));
  EXPECT_FALSE(router.isCached(http::Method::GET, "/search?page=0"));
}

TEST_F(RouterTest, DisabledCacheStillResolves) {
  router.setCacheCapacity(0);
  router.get("/a", Tag(200));
  ASSERT_NE(router.resolve(http::Method::GET, "/a?x"), nullptr);
  EXPECT_EQ(router.cacheSize(), 0U);
  EXPECT_EQ(router.cacheCapacity(), 0U);
}

TEST_F(RouterTest, RegistrationClearsCache) {
  router.get("/a", Tag(200));
  ASSERT_NE(router.resolve(http::Method::GET, "/a?x=1"), nullptr);
  EXPECT_EQ(router.cacheSize(), 1U);
  router.get("/a", Tag(250));
  EXPECT_EQ(router.cacheSize(), 0U);
  EXPECT_EQ(call(router.resolve(http::Method::GET, "/a?x=1")), 250);
}

TEST_F(RouterTest, InvalidRegistrations) {
  EXPECT_THROW(router.get("", Tag(200)), std::invalid_argument);
  EXPECT_THROW(router.get("/a", Router::Handler{}), std::invalid_argument);
  EXPECT_EQ(router.nbRoutes(), 0U);
}

TEST_F(RouterTest, CopiesDoNotShareCache) {
  router.get("/a", Tag(200));
  ASSERT_NE(router.resolve(http::Method::GET, "/a?x=1"), nullptr);

  Router copy(router);
  EXPECT_EQ(copy.nbRoutes(), 1U);
  EXPECT_EQ(copy.cacheSize(), 0U);
  EXPECT_EQ(copy.cacheCapacity(), router.cacheCapacity());

  const auto* pCopyHandler = copy.resolve(http::Method::GET, "/a?x=1");
  ASSERT_NE(pCopyHandler, nullptr);
  EXPECT_NE(pCopyHandler, router.resolve(http::Method::GET, "/a?x=1"));
  EXPECT_EQ(call(pCopyHandler), 200);

  Router moved(std::move(copy));
  EXPECT_EQ(moved.cacheSize(), 0U);
  EXPECT_EQ(call(moved.resolve(http::Method::GET, "/a")), 200);

  Router assigned;
  assigned = router;
  EXPECT_EQ(assigned.cacheSize(), 0U);
  EXPECT_EQ(assigned.nbRoutes(), 1U);
}

TEST_F(RouterTest, BuildKey) {
  EXPECT_EQ(Router::BuildKey(http::Method::GET, "/health"), "GET:/health");
  EXPECT_EQ(Router::BuildKey(http::Method::DELETE, "/items?id=3"), "DELETE:/items?id=3");
}

}  // namespace hearth
