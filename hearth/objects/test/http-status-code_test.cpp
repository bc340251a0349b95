#include "hearth/http-status-code.hpp"

#include <gtest/gtest.h>

namespace hearth::http {

TEST(HttpStatusCode, ReasonPhrases) {
  EXPECT_EQ(ReasonPhraseFor(StatusCodeOK), "OK");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeNotFound), "Not Found");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeRequestTimeout), "Request Timeout");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeRequestHeaderFieldsTooLarge), "Request Header Fields Too Large");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeInternalServerError), "Internal Server Error");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeServiceUnavailable), "Service Unavailable");
  EXPECT_TRUE(ReasonPhraseFor(299).empty());
}

TEST(HttpStatusCode, Validity) {
  static_assert(IsValidStatusCode(100));
  static_assert(IsValidStatusCode(599));
  static_assert(!IsValidStatusCode(99));
  static_assert(!IsValidStatusCode(600));
}

}  // namespace hearth::http
