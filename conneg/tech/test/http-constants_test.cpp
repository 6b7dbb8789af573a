#include "conneg/http-constants.hpp"

#include <gtest/gtest.h>

#include "conneg/http-status-code.hpp"

namespace conneg::http {

TEST(HttpConstantsTest, ReasonPhraseOfEmittedStatuses) {
  EXPECT_EQ(ReasonPhraseFor(StatusCodeOK), "OK");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeCreated), "Created");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeBadRequest), "Bad Request");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeNotAcceptable), "Not Acceptable");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeUnsupportedMediaType), "Unsupported Media Type");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeInternalServerError), "Internal Server Error");
  EXPECT_EQ(ReasonPhraseFor(static_cast<StatusCode>(599)), "");
}

TEST(HttpConstantsTest, MediaTypeTokensAreLowercase) {
  static_assert(ContentTypeApplicationJson == "application/json");
  static_assert(ContentTypeApplicationCbor == "application/cbor");
  EXPECT_EQ(MediaTypeWildcard, "*/*");
}

}  // namespace conneg::http
