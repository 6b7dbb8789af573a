#pragma once

#include <cassert>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

#include "conneg/http-request.hpp"
#include "conneg/http-response.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/media-type-selector.hpp"
#include "conneg/media-type.hpp"
#include "conneg/middleware.hpp"
#include "conneg/request-body-decoder.hpp"
#include "conneg/request-task.hpp"

namespace conneg {

// Format selected for one exchange before its handler runs.
struct NegotiatedFormat {
  MediaType mediaType;

  bool operator==(const NegotiatedFormat &) const noexcept = default;
};

// Progress of one exchange through the negotiation stage.
enum class ExchangeState : std::uint8_t {
  AwaitingNegotiation,
  FormatSelected,
  HandlerRunning,
  // Handler returned an ordinary response, forwarded untouched.
  PassThrough,
  Reencoding,
  Success,
  // Terminal failure states.
  NegotiationFailed,
  EncodeFailed,
  DecodeFailed
};

[[nodiscard]] std::string_view GetExchangeStateStr(ExchangeState state) noexcept;

// Optional callback notified on each state transition of an exchange.
using ExchangeObserver = std::function<void(ExchangeState)>;

// Outcome of NegotiationStage::preHandle(): either a selected format, or a 406 response short-circuiting the exchange.
class PreHandleResult {
 public:
  explicit PreHandleResult(NegotiatedFormat format) noexcept : _format(format) {}

  explicit PreHandleResult(MiddlewareResult shortCircuit) noexcept : _middlewareResult(std::move(shortCircuit)) {}

  [[nodiscard]] bool shouldContinue() const noexcept { return _middlewareResult.shouldContinue(); }

  [[nodiscard]] bool shouldShortCircuit() const noexcept { return _middlewareResult.shouldShortCircuit(); }

  [[nodiscard]] NegotiatedFormat format() const noexcept {
    assert(_format.has_value());
    return *_format;
  }

  [[nodiscard]] HttpResponse &&takeResponse() && noexcept { return std::move(_middlewareResult).takeResponse(); }

 private:
  MiddlewareResult _middlewareResult;
  std::optional<NegotiatedFormat> _format;
};

// Wraps request handlers with content negotiation.
//
// An exchange goes through three phases:
//   1. preHandle() selects the response format from the Accept header, or short-circuits with a 406.
//   2. The handler runs. It may return an ordinary response, or a placeholder carrying an ErasedPayload (Negotiate<T>).
//   3. postHandle() encodes the erased payload in the format selected in phase 1.
// handle() and handleAsync() chain the three phases for synchronous and coroutine handlers.
// If the handler failed to decode the request body (HttpRequest::bodyDecodeFailed()) and returned an ordinary
// response, the exchange ends in DecodeFailed and phase 3 is skipped.
//
// The stage holds no per-exchange state and can be shared between concurrent exchanges, as long as the observer can.
// The registry must outlive the stage.
class NegotiationStage {
 public:
  explicit NegotiationStage(const MediaTypeRegistry &registry, ExchangeObserver observer = {});

  [[nodiscard]] const MediaTypeRegistry &registry() const noexcept { return _selector.registry(); }

  // Phase 1.
  [[nodiscard]] PreHandleResult preHandle(const HttpRequest &request) const;

  // Phase 3. Responses without negotiated payload are returned unchanged.
  // Otherwise the payload is consumed and encoded: a 415 placeholder status becomes 200 while any other status is kept,
  // Content-Type is set to the selected media type and the encoded bytes replace the body.
  // If encoding fails, a 500 response is returned instead.
  [[nodiscard]] HttpResponse postHandle(NegotiatedFormat format, HttpResponse response) const;

  [[nodiscard]] HttpResponse handle(HttpRequest &request, const RequestHandler &handler) const;

  // Coroutine version of handle(). 'request' must stay alive until the returned task completes.
  [[nodiscard]] RequestTask<HttpResponse> handleAsync(HttpRequest &request, AsyncRequestHandler handler) const;

  // Decodes the request body with the registry of this stage.
  template <class T>
  [[nodiscard]] DecodeResult<T> decodeBody(HttpRequest &request) const {
    return DecodeRequestBody<T>(request, registry());
  }

  // Makes a RequestHandler from 'func', a callable taking (HttpRequest &, T) and returning an HttpResponse.
  // The request body is decoded into a T before 'func' is called, which is not invoked if decoding fails.
  // The returned handler references this stage.
  template <class T, class Func>
  [[nodiscard]] RequestHandler withDecodedBody(Func func) const {
    return [this, func = std::move(func)](HttpRequest &request) -> HttpResponse {
      auto decoded = decodeBody<T>(request);
      if (decoded.hasError()) {
        return DecodeErrorToResponse(decoded.error());
      }
      return func(request, std::move(decoded).value());
    };
  }

 private:
  // Phase 3 of handle() and handleAsync().
  HttpResponse finishExchange(const HttpRequest &request, NegotiatedFormat format, HttpResponse response) const;

  void notify(ExchangeState state) const {
    if (_observer) {
      _observer(state);
    }
  }

  MediaTypeSelector _selector;
  ExchangeObserver _observer;
};

}  // namespace conneg
