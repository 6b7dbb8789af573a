#include "conneg/request-body-decoder.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "conneg/http-constants.hpp"
#include "conneg/http-request.hpp"
#include "conneg/http-response.hpp"
#include "conneg/log.hpp"
#include "conneg/media-type-registry.hpp"
#include "conneg/media-type.hpp"
#include "conneg/negotiation-responses.hpp"

namespace conneg {

std::string_view GetDecodeErrorKindStr(DecodeError::Kind kind) noexcept {
  switch (kind) {
    case DecodeError::Kind::UnsupportedMediaType:
      return "unsupported media type";
    case DecodeError::Kind::MalformedBody:
      return "malformed body";
    case DecodeError::Kind::BodyUnavailable:
      return "body unavailable";
    default:
      return "unknown";
  }
}

namespace detail {

std::variant<MediaType, DecodeError> ResolveDeclaredMediaType(const HttpRequest &request,
                                                              const MediaTypeRegistry &registry) {
  const auto contentType = request.headerValue(http::ContentType);
  if (!contentType) {
    return registry.defaultMediaType();
  }
  if (auto mediaType = registry.resolve(*contentType)) {
    return *mediaType;
  }
  return DecodeError{DecodeError::Kind::UnsupportedMediaType, std::string(*contentType), std::nullopt};
}

std::optional<std::string_view> ConsumeBodyForDecode(HttpRequest &request, MediaType mediaType, DecodeError &error) {
  auto body = request.consumeBody();
  if (!body) {
    error.kind = DecodeError::Kind::BodyUnavailable;
    error.mediaType = mediaType;
    error.transportStatus = request.bodyFailureStatus();
    error.transportReason.assign(request.bodyFailureReason());
  }
  return body;
}

void ReportDecodeError(HttpRequest &request, const DecodeError &error) {
  request.markBodyDecodeFailed();
  switch (error.kind) {
    case DecodeError::Kind::UnsupportedMediaType:
      log::error("Cannot decode request body: declared content type '{}' is not registered", error.declaredType);
      break;
    case DecodeError::Kind::MalformedBody:
      log::error("Cannot decode request body of {} bytes as {}: {}", error.bodyLength, error.declaredType,
                 error.detail);
      break;
    case DecodeError::Kind::BodyUnavailable:
      log::error("Cannot read request body declared as {}: transport reported {} {}", error.declaredType,
                 error.transportStatus, error.transportReason);
      break;
    default:
      break;
  }
}

}  // namespace detail

HttpResponse DecodeErrorToResponse(const DecodeError &error) {
  switch (error.kind) {
    case DecodeError::Kind::UnsupportedMediaType:
      return MakeNotAcceptableResponse();
    case DecodeError::Kind::MalformedBody:
      return MakeMalformedBodyResponse();
    case DecodeError::Kind::BodyUnavailable:
      return HttpResponse(error.transportStatus).body(error.transportReason);
    default:
      std::unreachable();
  }
}

}  // namespace conneg
