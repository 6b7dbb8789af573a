#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "conneg/codec.hpp"
#include "conneg/http-request.hpp"
#include "conneg/http-response.hpp"
#include "conneg/http-status-code.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/media-type.hpp"

namespace conneg {

// Reason why a request body could not be turned into a typed value.
// All the fields are diagnostics for logs, DecodeErrorToResponse() only looks at the kind
// (and at the transport status and reason for BodyUnavailable).
struct DecodeError {
  enum class Kind : std::uint8_t {
    // Declared Content-Type is not registered. The body has not been read.
    UnsupportedMediaType,
    // Body bytes do not match the declared format or the expected value structure.
    MalformedBody,
    // Transport failed to deliver the body.
    BodyUnavailable
  };

  Kind kind;
  // Content-Type token as declared by the client (registry default token if absent).
  std::string declaredType;
  std::optional<MediaType> mediaType;
  // Codec message for MalformedBody.
  std::string detail;
  std::size_t bodyLength{};
  http::StatusCode transportStatus{};
  std::string transportReason;
};

[[nodiscard]] std::string_view GetDecodeErrorKindStr(DecodeError::Kind kind) noexcept;

// Either a decoded value or a DecodeError.
template <class T>
class DecodeResult {
 public:
  DecodeResult(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
      : _data(std::in_place_index<0>, std::move(value)) {}

  DecodeResult(DecodeError error) noexcept : _data(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool hasValue() const noexcept { return _data.index() == 0; }

  [[nodiscard]] bool hasError() const noexcept { return _data.index() == 1; }

  [[nodiscard]] T &value() & noexcept {
    assert(hasValue());
    return *std::get_if<0>(&_data);
  }

  [[nodiscard]] const T &value() const & noexcept {
    assert(hasValue());
    return *std::get_if<0>(&_data);
  }

  [[nodiscard]] T &&value() && noexcept {
    assert(hasValue());
    return std::move(*std::get_if<0>(&_data));
  }

  [[nodiscard]] const DecodeError &error() const noexcept {
    assert(hasError());
    return *std::get_if<1>(&_data);
  }

 private:
  std::variant<T, DecodeError> _data;
};

namespace detail {

// Resolves the declared Content-Type of 'request' against the registry.
// Returns the resolved media type, or the UnsupportedMediaType error. Does not touch the body.
std::variant<MediaType, DecodeError> ResolveDeclaredMediaType(const HttpRequest &request,
                                                              const MediaTypeRegistry &registry);

// Consumes the body of 'request'. Returns std::nullopt and fills 'error' on transport failure.
std::optional<std::string_view> ConsumeBodyForDecode(HttpRequest &request, MediaType mediaType, DecodeError &error);

// Logs 'error' and marks 'request' as having failed decoding.
void ReportDecodeError(HttpRequest &request, const DecodeError &error);

}  // namespace detail

// Decodes the body of 'request' as a T, using the codec selected by its Content-Type header
// (the registry default when the header is absent). The token is matched exactly: no wildcard, no parameters.
// The body is read at most once, and not at all when the declared type is not registered.
// On failure the request is marked with HttpRequest::markBodyDecodeFailed().
template <class T>
[[nodiscard]] DecodeResult<T> DecodeRequestBody(HttpRequest &request, const MediaTypeRegistry &registry) {
  auto resolved = detail::ResolveDeclaredMediaType(request, registry);
  if (auto *error = std::get_if<DecodeError>(&resolved)) {
    detail::ReportDecodeError(request, *error);
    return DecodeResult<T>(std::move(*error));
  }
  const MediaType mediaType = std::get<MediaType>(resolved);

  DecodeError error{DecodeError::Kind::BodyUnavailable, std::string(GetMediaTypeStr(mediaType)), mediaType};
  const auto body = detail::ConsumeBodyForDecode(request, mediaType, error);
  if (!body) {
    detail::ReportDecodeError(request, error);
    return DecodeResult<T>(std::move(error));
  }

  T value{};
  const auto codecResult = DecodeValue(mediaType, *body, value);
  if (codecResult.hasError()) {
    error.kind = DecodeError::Kind::MalformedBody;
    error.detail = codecResult.error().message;
    error.bodyLength = body->size();
    detail::ReportDecodeError(request, error);
    return DecodeResult<T>(std::move(error));
  }
  return DecodeResult<T>(std::move(value));
}

// Maps a decode failure to the response sent to the client.
[[nodiscard]] HttpResponse DecodeErrorToResponse(const DecodeError &error);

}  // namespace conneg
