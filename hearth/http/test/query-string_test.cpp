#include "hearth/query-string.hpp"

#include <gtest/gtest.h>

#include <string>

#include "hearth/flat-hash-map.hpp"

namespace hearth {

namespace {

flat_hash_map<std::string, std::string> Parse(std::string_view queryString) {
  flat_hash_map<std::string, std::string> out;
  ParseQueryString(queryString, out);
  return out;
}

}  // namespace

TEST(SplitTarget, NoQuery) {
  auto split = SplitTarget("/health");
  EXPECT_EQ(split.path, "/health");
  EXPECT_TRUE(split.queryString.empty());
  EXPECT_FALSE(split.hasQuery);
}

TEST(SplitTarget, SplitsAtFirstQuestionMark) {
  auto split = SplitTarget("/search?q=a?b&x");
  EXPECT_EQ(split.path, "/search");
  EXPECT_EQ(split.queryString, "q=a?b&x");
  EXPECT_TRUE(split.hasQuery);

  split = SplitTarget("/search?");
  EXPECT_EQ(split.path, "/search");
  EXPECT_TRUE(split.queryString.empty());
  EXPECT_TRUE(split.hasQuery);
}

TEST(ParseQueryString, SimplePairs) {
  auto query = Parse("a=1&b=2");
  EXPECT_EQ(query.size(), 2U);
  EXPECT_EQ(query["a"], "1");
  EXPECT_EQ(query["b"], "2");
}

TEST(ParseQueryString, LastValueWins) {
  auto query = Parse("a=1&a=2");
  EXPECT_EQ(query.size(), 1U);
  EXPECT_EQ(query["a"], "2");
}

TEST(ParseQueryString, MissingValuesAreEmpty) {
  auto query = Parse("a&b=");
  EXPECT_EQ(query.size(), 2U);
  EXPECT_EQ(query["a"], "");
  EXPECT_EQ(query["b"], "");
}

TEST(ParseQueryString, EmptyKeysAreSkipped) {
  auto query = Parse("=1&&b=2&");
  EXPECT_EQ(query.size(), 2U);
  EXPECT_EQ(query["b"], "2");
  // '=1': empty key, the '=' is skipped and '1' is read as a key
  EXPECT_EQ(query["1"], "");
  EXPECT_TRUE(Parse("").empty());
}

TEST(ParseQueryString, PercentDecoding) {
  auto query = Parse("na%20me=J%C3%A9r%C3%B4me&sum=1%2B1&plus=a+b&eq=%3D");
  EXPECT_EQ(query["na me"], "Jérôme");
  EXPECT_EQ(query["sum"], "1+1");
  EXPECT_EQ(query["plus"], "a+b");
  EXPECT_EQ(query["eq"], "=");
}

TEST(ParseQueryString, MalformedPairsAreDropped) {
  auto query = Parse("bad=%ZZ&ok=1&trunc=%4&%zz=2&utf=%FF");
  EXPECT_EQ(query.size(), 1U);
  EXPECT_EQ(query["ok"], "1");
}

TEST(ParseQueryString, ValueMayContainEquals) {
  auto query = Parse("expr=a=b");
  EXPECT_EQ(query["expr"], "a=b");
}

}  // namespace hearth
