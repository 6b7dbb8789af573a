#include "conneg/request-body-decoder.hpp"

#include <glaze/glaze.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "conneg/codec.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/http-request.hpp"
#include "conneg/http-status-code.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/media-type.hpp"
#include "conneg/negotiation-config.hpp"
#include "conneg/negotiation-responses.hpp"

namespace conneg::test {

struct Order {
  std::string item;
  int quantity{};
};

}  // namespace conneg::test

template <>
struct glz::meta<conneg::test::Order> {
  using T = conneg::test::Order;
  static constexpr auto value = glz::object("item", &T::item, "quantity", &T::quantity);
};

namespace conneg::test {

class RequestBodyDecoderTest : public ::testing::Test {
 protected:
  MediaTypeRegistry jsonDefault{NegotiationConfig{}};
  MediaTypeRegistry cborDefault{NegotiationConfig{}.withDefaultFormat(MediaType::cbor)};
};

TEST_F(RequestBodyDecoderTest, DecodeJson) {
  auto request = HttpRequest()
                     .addHeader(http::ContentType, http::ContentTypeApplicationJson)
                     .body(R"({"item":"apple","quantity":4})");
  auto result = DecodeRequestBody<Order>(request, jsonDefault);
  ASSERT_TRUE(result.hasValue());
  EXPECT_EQ(result.value().item, "apple");
  EXPECT_EQ(result.value().quantity, 4);
  EXPECT_TRUE(request.bodyConsumed());
  EXPECT_FALSE(request.bodyDecodeFailed());
}

TEST_F(RequestBodyDecoderTest, AbsentContentTypeUsesRegistryDefault) {
  std::string cbor;
  ASSERT_FALSE(EncodeValue(MediaType::cbor, Order{"pear", 2}, cbor).hasError());

  auto request = HttpRequest().body(cbor);
  auto result = DecodeRequestBody<Order>(request, cborDefault);
  ASSERT_TRUE(result.hasValue());
  EXPECT_EQ(result.value().item, "pear");
  EXPECT_EQ(result.value().quantity, 2);

  auto jsonRequest = HttpRequest().body(cbor);
  auto failure = DecodeRequestBody<Order>(jsonRequest, jsonDefault);
  ASSERT_TRUE(failure.hasError());
  EXPECT_EQ(failure.error().kind, DecodeError::Kind::MalformedBody);
  EXPECT_EQ(failure.error().declaredType, http::ContentTypeApplicationJson);
}

TEST_F(RequestBodyDecoderTest, UnsupportedContentTypeDoesNotReadBody) {
  static constexpr std::string_view kTokens[] = {"text/plain", "*/*", "APPLICATION/JSON", "application/x-beve",
                                                 "application/json; charset=utf-8", ""};
  for (std::string_view token : kTokens) {
    auto request = HttpRequest().addHeader(http::ContentType, token).body("{}");
    auto result = DecodeRequestBody<Order>(request, jsonDefault);
    ASSERT_TRUE(result.hasError()) << token;
    EXPECT_EQ(result.error().kind, DecodeError::Kind::UnsupportedMediaType);
    EXPECT_EQ(result.error().declaredType, token);
    EXPECT_EQ(result.error().mediaType, std::nullopt);
    EXPECT_FALSE(request.bodyConsumed()) << token;
    EXPECT_TRUE(request.bodyDecodeFailed()) << token;
  }
}

TEST_F(RequestBodyDecoderTest, MalformedBody) {
  auto request = HttpRequest().addHeader(http::ContentType, http::ContentTypeApplicationJson).body("{not json");
  auto result = DecodeRequestBody<Order>(request, jsonDefault);
  ASSERT_TRUE(result.hasError());
  const DecodeError &error = result.error();
  EXPECT_EQ(error.kind, DecodeError::Kind::MalformedBody);
  EXPECT_EQ(error.mediaType, MediaType::json);
  EXPECT_EQ(error.bodyLength, 9U);
  EXPECT_FALSE(error.detail.empty());
}

TEST_F(RequestBodyDecoderTest, SchemaMismatchIsMalformed) {
  auto request = HttpRequest()
                     .addHeader(http::ContentType, http::ContentTypeApplicationJson)
                     .body(R"({"item":12,"quantity":"many"})");
  auto result = DecodeRequestBody<Order>(request, jsonDefault);
  ASSERT_TRUE(result.hasError());
  EXPECT_EQ(result.error().kind, DecodeError::Kind::MalformedBody);
}

TEST_F(RequestBodyDecoderTest, MissingFieldsAreMalformed) {
  static constexpr std::string_view kBodies[] = {"{}", R"({"item":"apple"})", R"({"quantity":1})"};
  for (std::string_view body : kBodies) {
    auto request = HttpRequest().addHeader(http::ContentType, http::ContentTypeApplicationJson).body(std::string(body));
    auto result = DecodeRequestBody<Order>(request, jsonDefault);
    ASSERT_TRUE(result.hasError()) << body;
    EXPECT_EQ(result.error().kind, DecodeError::Kind::MalformedBody) << body;
    EXPECT_TRUE(request.bodyDecodeFailed()) << body;
  }
}

TEST_F(RequestBodyDecoderTest, BodyUnavailable) {
  auto request = HttpRequest()
                     .addHeader(http::ContentType, http::ContentTypeApplicationCbor)
                     .bodyUnavailable(http::StatusCodePayloadTooLarge, "Body exceeds limit");
  auto result = DecodeRequestBody<Order>(request, jsonDefault);
  ASSERT_TRUE(result.hasError());
  EXPECT_EQ(result.error().kind, DecodeError::Kind::BodyUnavailable);
  EXPECT_EQ(result.error().mediaType, MediaType::cbor);
  EXPECT_EQ(result.error().transportStatus, http::StatusCodePayloadTooLarge);

  auto response = DecodeErrorToResponse(result.error());
  EXPECT_EQ(response.status(), http::StatusCodePayloadTooLarge);
  EXPECT_EQ(response.body(), "Body exceeds limit");
}

TEST_F(RequestBodyDecoderTest, ErrorToResponse) {
  auto notAcceptable = DecodeErrorToResponse(DecodeError{DecodeError::Kind::UnsupportedMediaType, "text/xml"});
  EXPECT_EQ(notAcceptable.status(), http::StatusCodeNotAcceptable);
  EXPECT_EQ(notAcceptable.body(), kNotAcceptableBody);
  EXPECT_FALSE(notAcceptable.headerValue(http::ContentType).has_value());

  DecodeError malformed{DecodeError::Kind::MalformedBody, "application/json", MediaType::json};
  malformed.detail = "expected_brace at index 0";
  auto badRequest = DecodeErrorToResponse(malformed);
  EXPECT_EQ(badRequest.status(), http::StatusCodeBadRequest);
  EXPECT_EQ(badRequest.body(), kMalformedBodyBody);
}

TEST(DecodeErrorTest, KindStr) {
  EXPECT_EQ(GetDecodeErrorKindStr(DecodeError::Kind::UnsupportedMediaType), "unsupported media type");
  EXPECT_EQ(GetDecodeErrorKindStr(DecodeError::Kind::MalformedBody), "malformed body");
  EXPECT_EQ(GetDecodeErrorKindStr(DecodeError::Kind::BodyUnavailable), "body unavailable");
}

}  // namespace conneg::test
