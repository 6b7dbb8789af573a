#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "conneg/erased-payload.hpp"
#include "conneg/http-constants.hpp"
#include "conneg/http-status-code.hpp"
#include "conneg/smallvector.hpp"

namespace conneg {

// -----------------------------------------------------------------------------
// HttpResponse
// -----------------------------------------------------------------------------
// Response side of one exchange: status line, header fields and body, plus out-of-band
// metadata which is never serialized on the wire.
//
// The only metadata currently carried is the negotiated payload: a type-erased value that a
// handler wants encoded in the format negotiated for the exchange (see Negotiate<T> and
// NegotiationStage). While such a payload is attached, status, headers and body are only a
// placeholder which NegotiationStage replaces.
//
// Header Field Strategy:
//   addHeader() always appends, header() replaces the value of the first field with the same name
//   (case-insensitive comparison) or appends if none exists. Original casing of the first occurrence
//   is preserved.
//
// Safety & Assumptions:
//   - Not thread-safe.
//   - Assumes ASCII header names; no validation performed.
// -----------------------------------------------------------------------------
class HttpResponse {
 public:
  struct HeaderField {
    std::string name;
    std::string value;
  };

  // Constructs an HttpResponse with the given status code and optional reason phrase.
  // If no reason phrase is given, the canonical one of the status code is reported by reason().
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  // Constructs an HttpResponse with a 200 status code and given body.
  // The content type header is set if the body is not empty and contentType is not empty.
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  // Explicit reason phrase if set, otherwise the canonical one of the current status code.
  [[nodiscard]] std::string_view reason() const noexcept {
    return _reason.empty() ? http::ReasonPhraseFor(_status) : std::string_view(_reason);
  }

  // Retrieves the value of the first occurrence of the given header key (case-insensitive search).
  // If the header is not found, returns std::nullopt.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  // Same as headerValue() but returns an empty view for absent headers.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] std::span<const HeaderField> headers() const noexcept { return {_headers.data(), _headers.size()}; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Replaces the status code. Any explicit reason phrase is dropped as it would no longer match.
  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    _reason.clear();
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept { return std::move(status(statusCode)); }

  // Replaces the status code and the reason phrase.
  HttpResponse& status(http::StatusCode statusCode, std::string_view reason) & {
    _status = statusCode;
    _reason.assign(reason);
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode, std::string_view reason) && {
    return std::move(status(statusCode, reason));
  }

  // Appends a header field, allowing duplicates.
  HttpResponse& addHeader(std::string_view key, std::string_view value) &;

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    return std::move(addHeader(key, value));
  }

  // Add or replace a header value entirely ensuring at most one instance.
  HttpResponse& header(std::string_view key, std::string_view value) &;

  HttpResponse&& header(std::string_view key, std::string_view value) && { return std::move(header(key, value)); }

  // Removes all the fields with given name. Returns the number of removed fields.
  std::size_t headerRemove(std::string_view key) noexcept;

  // Assigns the given body to this HttpResponse, and sets the Content-Type header if both the body and
  // contentType are non empty. An empty contentType leaves the header fields untouched.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) &;

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    return std::move(this->body(std::move(body), contentType));
  }

  // Gets the negotiated payload attached to this response, or nullptr if there is none.
  [[nodiscard]] const ErasedPayload* negotiatedPayload() const noexcept {
    return _negotiatedPayload ? &*_negotiatedPayload : nullptr;
  }

  // Attaches a payload to be encoded in the format negotiated for the exchange.
  HttpResponse& negotiatedPayload(ErasedPayload payload) & noexcept {
    _negotiatedPayload.emplace(std::move(payload));
    return *this;
  }

  HttpResponse&& negotiatedPayload(ErasedPayload payload) && noexcept {
    return std::move(negotiatedPayload(std::move(payload)));
  }

  // Detaches the negotiated payload, if any. After this call negotiatedPayload() returns nullptr.
  [[nodiscard]] std::optional<ErasedPayload> takeNegotiatedPayload() noexcept {
    return std::exchange(_negotiatedPayload, std::nullopt);
  }

 private:
  SmallVector<HeaderField, 4> _headers;
  std::string _reason;
  std::string _body;
  std::optional<ErasedPayload> _negotiatedPayload;
  http::StatusCode _status;
};

}  // namespace conneg
