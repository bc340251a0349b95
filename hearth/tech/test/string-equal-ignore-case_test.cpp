#include "hearth/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

namespace hearth {

TEST(StringEqualIgnoreCase, CaseInsensitiveEqual) {
  static_assert(CaseInsensitiveEqual("Content-Length", "content-length"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
  EXPECT_FALSE(CaseInsensitiveEqual("close", "closed"));
  EXPECT_FALSE(CaseInsensitiveEqual("abc", "abd"));
}

TEST(StringEqualIgnoreCase, ToLowerCopy) {
  EXPECT_EQ(ToLowerCopy("X-Request-ID"), "x-request-id");
  EXPECT_EQ(ToLowerCopy("\xC3\x89"), "\xC3\x89");
}

TEST(StringEqualIgnoreCase, ContainsToken) {
  EXPECT_TRUE(ContainsTokenIgnoreCase("close", "close"));
  EXPECT_TRUE(ContainsTokenIgnoreCase("keep-alive, Close", "close"));
  EXPECT_TRUE(ContainsTokenIgnoreCase(" Upgrade ,\tKeep-Alive ", "keep-alive"));
  EXPECT_FALSE(ContainsTokenIgnoreCase("closed", "close"));
  EXPECT_FALSE(ContainsTokenIgnoreCase("", "close"));
}

}  // namespace hearth
