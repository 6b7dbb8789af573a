#include "conneg/negotiation-stage.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "conneg/http-constants.hpp"
#include "conneg/http-request.hpp"
#include "conneg/http-response.hpp"
#include "conneg/http-status-code.hpp"
#include "conneg/log.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/media-type.hpp"
#include "conneg/middleware.hpp"
#include "conneg/negotiation-responses.hpp"
#include "conneg/request-task.hpp"

namespace conneg {

std::string_view GetExchangeStateStr(ExchangeState state) noexcept {
  switch (state) {
    case ExchangeState::AwaitingNegotiation:
      return "awaiting-negotiation";
    case ExchangeState::FormatSelected:
      return "format-selected";
    case ExchangeState::HandlerRunning:
      return "handler-running";
    case ExchangeState::PassThrough:
      return "pass-through";
    case ExchangeState::Reencoding:
      return "reencoding";
    case ExchangeState::Success:
      return "success";
    case ExchangeState::NegotiationFailed:
      return "negotiation-failed";
    case ExchangeState::EncodeFailed:
      return "encode-failed";
    case ExchangeState::DecodeFailed:
      return "decode-failed";
    default:
      return "unknown";
  }
}

NegotiationStage::NegotiationStage(const MediaTypeRegistry &registry, ExchangeObserver observer)
    : _selector(registry), _observer(std::move(observer)) {}

PreHandleResult NegotiationStage::preHandle(const HttpRequest &request) const {
  notify(ExchangeState::AwaitingNegotiation);
  const auto accept = request.headerValue(http::Accept);
  const auto selected = _selector.negotiateAccept(accept);
  if (!selected) {
    log::warn("No acceptable media type for {} (Accept: '{}')", request.path(), accept.value_or(""));
    notify(ExchangeState::NegotiationFailed);
    return PreHandleResult(MiddlewareResult::ShortCircuit(MakeNotAcceptableResponse()));
  }
  notify(ExchangeState::FormatSelected);
  return PreHandleResult(NegotiatedFormat{*selected});
}

HttpResponse NegotiationStage::postHandle(NegotiatedFormat format, HttpResponse response) const {
  auto payload = response.takeNegotiatedPayload();
  if (!payload) {
    log::debug("Response {} has no negotiated payload, forwarded as is", response.status());
    notify(ExchangeState::PassThrough);
    return response;
  }

  notify(ExchangeState::Reencoding);
  std::string encoded;
  const auto result = payload->serialize(format.mediaType, encoded);
  if (result.hasError()) {
    log::error("Failed to encode response payload as {}: {}", GetMediaTypeStr(result.error().mediaType),
               result.error().message);
    notify(ExchangeState::EncodeFailed);
    return MakeEncodeFailureResponse();
  }

  if (response.status() == http::StatusCodeUnsupportedMediaType) {
    response.status(http::StatusCodeOK);
  }
  response.headerRemove(http::ContentLength);
  response.header(http::ContentType, GetMediaTypeStr(format.mediaType));
  response.body(std::move(encoded), {});
  notify(ExchangeState::Success);
  return response;
}

HttpResponse NegotiationStage::finishExchange(const HttpRequest &request, NegotiatedFormat format,
                                              HttpResponse response) const {
  if (request.bodyDecodeFailed() && response.negotiatedPayload() == nullptr) {
    log::debug("Request body of {} could not be decoded, response {} forwarded as is", request.path(),
               response.status());
    notify(ExchangeState::DecodeFailed);
    return response;
  }
  return postHandle(format, std::move(response));
}

HttpResponse NegotiationStage::handle(HttpRequest &request, const RequestHandler &handler) const {
  auto preHandleResult = preHandle(request);
  if (preHandleResult.shouldShortCircuit()) {
    return std::move(preHandleResult).takeResponse();
  }
  notify(ExchangeState::HandlerRunning);
  return finishExchange(request, preHandleResult.format(), handler(request));
}

RequestTask<HttpResponse> NegotiationStage::handleAsync(HttpRequest &request, AsyncRequestHandler handler) const {
  auto preHandleResult = preHandle(request);
  if (preHandleResult.shouldShortCircuit()) {
    co_return std::move(preHandleResult).takeResponse();
  }
  notify(ExchangeState::HandlerRunning);
  HttpResponse response = co_await handler(request);
  co_return finishExchange(request, preHandleResult.format(), std::move(response));
}

}  // namespace conneg
