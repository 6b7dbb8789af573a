#pragma once

#include <type_traits>
#include <utility>

#include "conneg/erased-payload.hpp"
#include "conneg/http-request.hpp"
#include "conneg/http-response.hpp"
#include "conneg/http-status-code.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/negotiation-responses.hpp"
#include "conneg/request-body-decoder.hpp"

namespace conneg {

// Typed value whose wire format is decided by content negotiation.
//
// Inbound, FromRequest() decodes the request body with the codec of its declared Content-Type.
// Outbound, intoResponse() erases the value into a placeholder response that NegotiationStage encodes
// in the format it selected before the handler ran:
//
//   HttpResponse handler(HttpRequest &) {
//     return Negotiate(Greeting{"Hello"}).intoResponse();
//   }
//
// A placeholder response that is not post-processed by a NegotiationStage is a 415 with a diagnostic body.
template <class T>
class Negotiate {
 public:
  using value_type = T;

  explicit Negotiate(T value) noexcept(std::is_nothrow_move_constructible_v<T>) : _value(std::move(value)) {}

  // Decodes the body of 'request' into a Negotiate<T>. See DecodeRequestBody().
  [[nodiscard]] static DecodeResult<Negotiate> FromRequest(HttpRequest &request, const MediaTypeRegistry &registry) {
    auto decoded = DecodeRequestBody<T>(request, registry);
    if (decoded.hasError()) {
      return DecodeResult<Negotiate>(decoded.error());
    }
    return DecodeResult<Negotiate>(Negotiate(std::move(decoded).value()));
  }

  [[nodiscard]] T &value() & noexcept { return _value; }
  [[nodiscard]] const T &value() const & noexcept { return _value; }
  [[nodiscard]] T &&value() && noexcept { return std::move(_value); }

  T *operator->() noexcept { return &_value; }
  const T *operator->() const noexcept { return &_value; }

  // Builds the placeholder response carrying the erased value.
  [[nodiscard]] HttpResponse intoResponse() && { return MakeMisconfiguredResponse(ErasedPayload(std::move(_value))); }

  // Same as above, with a status that the negotiation stage keeps as is (for instance 201).
  [[nodiscard]] HttpResponse intoResponse(http::StatusCode statusCode) && {
    return MakeMisconfiguredResponse(ErasedPayload(std::move(_value))).status(statusCode);
  }

 private:
  T _value;
};

}  // namespace conneg
