#include "hearth/lru-cache.hpp"

#include <gtest/gtest.h>

#include <string>

#include "hearth/response-cache.hpp"

namespace hearth {

TEST(LruCache, InsertAndFind) {
  LruCache<std::string, int> cache(2);
  EXPECT_TRUE(cache.empty());
  cache.insert("a", 1);
  cache.insert("b", 2);
  ASSERT_NE(cache.find("a"), nullptr);
  EXPECT_EQ(*cache.find("a"), 1);
  EXPECT_EQ(cache.find("c"), nullptr);
  EXPECT_EQ(cache.size(), 2U);
}

TEST(LruCache, EvictsLeastRecentlyUsed) {
  LruCache<std::string, int> cache(2);
  cache.insert("a", 1);
  cache.insert("b", 2);
  ASSERT_NE(cache.find("a"), nullptr);  // 'b' becomes the least recently used
  cache.insert("c", 3);
  EXPECT_TRUE(cache.contains("a"));
  EXPECT_FALSE(cache.contains("b"));
  EXPECT_TRUE(cache.contains("c"));
  EXPECT_EQ(cache.size(), 2U);
}

TEST(LruCache, InsertExistingReplacesValue) {
  LruCache<std::string, int> cache(2);
  cache.insert("a", 1);
  cache.insert("b", 2);
  cache.insert("a", 10);
  EXPECT_EQ(cache.size(), 2U);
  cache.insert("c", 3);
  EXPECT_FALSE(cache.contains("b"));
  ASSERT_NE(cache.find("a"), nullptr);
  EXPECT_EQ(*cache.find("a"), 10);
}

TEST(LruCache, ZeroCapacityDisablesCache) {
  LruCache<std::string, int> cache(0);
  cache.insert("a", 1);
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(cache.find("a"), nullptr);
}

TEST(LruCache, CopyIsIndependent) {
  LruCache<std::string, int> cache(3);
  cache.insert("a", 1);
  cache.insert("b", 2);
  LruCache<std::string, int> copy(cache);
  copy.insert("c", 3);
  *copy.find("a") = 100;
  EXPECT_EQ(cache.size(), 2U);
  EXPECT_EQ(*cache.find("a"), 1);
  EXPECT_EQ(copy.size(), 3U);

  cache.clear();
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(copy.size(), 3U);
}

TEST(ResponseCache, StoresSerializedBodies) {
  ResponseCache cache(1);
  cache.insert("GET:/health", R"({"status":"healthy"})");
  cache.insert("GET:/health?x=1", R"({"status":"healthy"})");
  EXPECT_EQ(cache.size(), 1U);
  EXPECT_TRUE(cache.contains("GET:/health?x=1"));
}

}  // namespace hearth
