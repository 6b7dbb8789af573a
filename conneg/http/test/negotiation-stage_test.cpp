#include "conneg/negotiation-stage.hpp"

#include <glaze/glaze.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <coroutine>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "conneg/codec.hpp"
#include "conneg/erased-payload.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/http-request.hpp"
#include "conneg/http-response.hpp"
#include "conneg/http-status-code.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/media-type.hpp"
#include "conneg/negotiate.hpp"
#include "conneg/negotiation-config.hpp"
#include "conneg/negotiation-responses.hpp"
#include "conneg/request-task.hpp"

namespace conneg::test {

struct Status {
  std::string state;
  int code{};

  bool operator==(const Status &) const = default;
};

// Value whose JSON writer always reports an error.
struct NotEncodable {
  int value{};
};

}  // namespace conneg::test

template <>
struct glz::meta<conneg::test::Status> {
  using T = conneg::test::Status;
  static constexpr auto value = glz::object("state", &T::state, "code", &T::code);
};

template <>
struct glz::to<glz::JSON, conneg::test::NotEncodable> {
  template <auto Opts>
  static void op(const conneg::test::NotEncodable &, glz::is_context auto &&ctx, auto &&...) noexcept {
    ctx.error = glz::error_code::syntax_error;
  }
};

namespace conneg::test {

class NegotiationStageTest : public ::testing::Test {
 protected:
  NegotiationStageTest()
      : stage(registry, [this](ExchangeState state) { states.push_back(state); }) {}

  MediaTypeRegistry registry{NegotiationConfig{}};
  std::vector<ExchangeState> states;
  NegotiationStage stage;
  Status decodeBodyOrDefault(HttpRequest &request) const {
    auto decoded = stage.decodeBody<Status>(request);
    return decoded.hasError() ? Status{"fallback", 0} : std::move(decoded).value();
  }

  int nbHandlerCalls{};
};

TEST_F(NegotiationStageTest, PreHandleSelectsFormat) {
  auto request = HttpRequest().addHeader(http::Accept, "application/cbor;q=0.9, application/json;q=0.2");
  auto result = stage.preHandle(request);
  ASSERT_TRUE(result.shouldContinue());
  EXPECT_EQ(result.format(), NegotiatedFormat{MediaType::cbor});
  EXPECT_EQ(states, (std::vector<ExchangeState>{ExchangeState::AwaitingNegotiation, ExchangeState::FormatSelected}));
}

TEST_F(NegotiationStageTest, PreHandleShortCircuits) {
  auto request = HttpRequest().addHeader(http::Accept, "text/html");
  auto result = stage.preHandle(request);
  ASSERT_TRUE(result.shouldShortCircuit());
  auto response = std::move(result).takeResponse();
  EXPECT_EQ(response.status(), http::StatusCodeNotAcceptable);
  EXPECT_EQ(response.body(), kNotAcceptableBody);
  EXPECT_FALSE(response.headerValue(http::ContentType).has_value());
  EXPECT_EQ(states.back(), ExchangeState::NegotiationFailed);
}

TEST_F(NegotiationStageTest, PostHandlePassThrough) {
  auto response = stage.postHandle(NegotiatedFormat{MediaType::cbor},
                                   HttpResponse(http::StatusCodeNotFound).body("not here").header("X-Id", "5"));
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(response.body(), "not here");
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeTextPlain);
  EXPECT_EQ(response.headerValue("X-Id"), "5");
  EXPECT_EQ(states, (std::vector<ExchangeState>{ExchangeState::PassThrough}));
}

TEST_F(NegotiationStageTest, PostHandleReencodes) {
  auto placeholder = Negotiate(Status{"up", 1}).intoResponse();
  placeholder.header(http::ContentLength, "27");
  auto response = stage.postHandle(NegotiatedFormat{MediaType::cbor}, std::move(placeholder));
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeApplicationCbor);
  EXPECT_FALSE(response.headerValue(http::ContentLength).has_value());
  EXPECT_EQ(response.negotiatedPayload(), nullptr);

  std::string expected;
  ASSERT_FALSE(EncodeValue(MediaType::cbor, Status{"up", 1}, expected).hasError());
  EXPECT_EQ(response.body(), expected);
  EXPECT_EQ(states, (std::vector<ExchangeState>{ExchangeState::Reencoding, ExchangeState::Success}));
}

TEST_F(NegotiationStageTest, PostHandleKeepsExplicitStatus) {
  auto response = stage.postHandle(NegotiatedFormat{MediaType::json},
                                   Negotiate(Status{"created", 2}).intoResponse(http::StatusCodeCreated));
  EXPECT_EQ(response.status(), http::StatusCodeCreated);
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeApplicationJson);
  EXPECT_EQ(response.body(), R"({"state":"created","code":2})");
}

TEST_F(NegotiationStageTest, PostHandleEncodeFailure) {
  auto response = stage.postHandle(NegotiatedFormat{MediaType::json},
                                   MakeMisconfiguredResponse(ErasedPayload(NotEncodable{1})));
  EXPECT_EQ(response.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(response.body(), kEncodeFailureBody);
  EXPECT_EQ(response.negotiatedPayload(), nullptr);
  EXPECT_EQ(states.back(), ExchangeState::EncodeFailed);
}

TEST_F(NegotiationStageTest, HandleRunsAllPhases) {
  auto request = HttpRequest().addHeader(http::Accept, "application/json");
  auto response = stage.handle(request, [this](HttpRequest &) {
    ++nbHandlerCalls;
    return Negotiate(Status{"ok", 0}).intoResponse();
  });
  EXPECT_EQ(nbHandlerCalls, 1);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), R"({"state":"ok","code":0})");
  EXPECT_EQ(states, (std::vector<ExchangeState>{ExchangeState::AwaitingNegotiation, ExchangeState::FormatSelected,
                                                ExchangeState::HandlerRunning, ExchangeState::Reencoding,
                                                ExchangeState::Success}));
}

TEST_F(NegotiationStageTest, HandleDoesNotInvokeHandlerOnNegotiationFailure) {
  auto request = HttpRequest().addHeader(http::Accept, "image/png");
  auto response = stage.handle(request, [this](HttpRequest &) {
    ++nbHandlerCalls;
    return HttpResponse("unexpected");
  });
  EXPECT_EQ(nbHandlerCalls, 0);
  EXPECT_EQ(response.status(), http::StatusCodeNotAcceptable);
}

TEST_F(NegotiationStageTest, HandlerExceptionPropagates) {
  HttpRequest request;
  EXPECT_THROW((void)stage.handle(request, [](HttpRequest &) -> HttpResponse { throw std::runtime_error("boom"); }),
               std::runtime_error);
}

TEST_F(NegotiationStageTest, WithDecodedBody) {
  auto handler = stage.withDecodedBody<Status>([this](HttpRequest &, Status status) {
    ++nbHandlerCalls;
    status.code += 1;
    return Negotiate(std::move(status)).intoResponse();
  });

  auto request = HttpRequest()
                     .addHeader(http::Accept, "application/json")
                     .addHeader(http::ContentType, http::ContentTypeApplicationJson)
                     .body(R"({"state":"in","code":41})");
  auto response = stage.handle(request, handler);
  EXPECT_EQ(nbHandlerCalls, 1);
  EXPECT_EQ(response.body(), R"({"state":"in","code":42})");

  states.clear();
  auto malformed = HttpRequest().addHeader(http::ContentType, http::ContentTypeApplicationJson).body("{");
  auto badRequest = stage.handle(malformed, handler);
  EXPECT_EQ(nbHandlerCalls, 1);
  EXPECT_TRUE(malformed.bodyDecodeFailed());
  EXPECT_EQ(badRequest.status(), http::StatusCodeBadRequest);
  EXPECT_EQ(badRequest.body(), kMalformedBodyBody);
  EXPECT_EQ(states, (std::vector<ExchangeState>{ExchangeState::AwaitingNegotiation, ExchangeState::FormatSelected,
                                                ExchangeState::HandlerRunning, ExchangeState::DecodeFailed}));
}

TEST_F(NegotiationStageTest, DecodeFailureInAsyncHandlerIsTerminal) {
  auto request = HttpRequest().addHeader(http::ContentType, "text/csv").body("a,b");
  auto task = stage.handleAsync(request, [this](HttpRequest &req) -> RequestTask<HttpResponse> {
    auto decoded = Negotiate<Status>::FromRequest(req, registry);
    if (decoded.hasError()) {
      co_return DecodeErrorToResponse(decoded.error());
    }
    co_return std::move(decoded).value().intoResponse();
  });
  auto response = task.runSynchronously();
  EXPECT_EQ(response.status(), http::StatusCodeNotAcceptable);
  EXPECT_EQ(states.back(), ExchangeState::DecodeFailed);
  EXPECT_EQ(std::ranges::count(states, ExchangeState::PassThrough), 0);
}

TEST_F(NegotiationStageTest, PayloadReturnedDespiteDecodeFailureIsEncoded) {
  auto request = HttpRequest().addHeader(http::ContentType, http::ContentTypeApplicationJson).body("[]");
  auto response = stage.handle(request, [this](HttpRequest &req) {
    auto decoded = decodeBodyOrDefault(req);
    return Negotiate(std::move(decoded)).intoResponse();
  });
  EXPECT_TRUE(request.bodyDecodeFailed());
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), R"({"state":"fallback","code":0})");
  EXPECT_EQ(states.back(), ExchangeState::Success);
}

TEST_F(NegotiationStageTest, HandleAsyncAwaitsHandler) {
  bool handlerResumed = false;
  auto request = HttpRequest().addHeader(http::Accept, "application/cbor");
  auto task = stage.handleAsync(request, [&handlerResumed](HttpRequest &) -> RequestTask<HttpResponse> {
    co_await std::suspend_always{};
    handlerResumed = true;
    co_return Negotiate(Status{"async", 3}).intoResponse();
  });

  task.resume();
  EXPECT_FALSE(task.done());
  EXPECT_FALSE(handlerResumed);
  EXPECT_EQ(states.back(), ExchangeState::HandlerRunning);

  task.resume();
  ASSERT_TRUE(task.done());
  EXPECT_TRUE(handlerResumed);

  auto response = task.runSynchronously();
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.headerValue(http::ContentType), http::ContentTypeApplicationCbor);

  Status decoded;
  ASSERT_FALSE(DecodeValue(MediaType::cbor, response.body(), decoded).hasError());
  EXPECT_EQ(decoded, (Status{"async", 3}));
}

TEST_F(NegotiationStageTest, HandleAsyncShortCircuit) {
  auto request = HttpRequest().addHeader(http::Accept, "");
  auto task = stage.handleAsync(request, [this](HttpRequest &) -> RequestTask<HttpResponse> {
    ++nbHandlerCalls;
    co_return HttpResponse("unexpected");
  });
  auto response = task.runSynchronously();
  EXPECT_EQ(nbHandlerCalls, 0);
  EXPECT_EQ(response.status(), http::StatusCodeNotAcceptable);
}

TEST(ExchangeStateTest, Str) {
  EXPECT_EQ(GetExchangeStateStr(ExchangeState::AwaitingNegotiation), "awaiting-negotiation");
  EXPECT_EQ(GetExchangeStateStr(ExchangeState::Reencoding), "reencoding");
  EXPECT_EQ(GetExchangeStateStr(ExchangeState::DecodeFailed), "decode-failed");
}

}  // namespace conneg::test
