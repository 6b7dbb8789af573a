#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "conneg/http-status-code.hpp"
#include "conneg/smallvector.hpp"

namespace conneg {

// Request side of one exchange, as seen by the negotiation layer.
// The transport (out of scope here) fills headers and body, then hands the request to the pipeline.
class HttpRequest {
 public:
  explicit HttpRequest(std::string_view path = "/");

  // Appends a header field. If a field with the same name (case-insensitive) is already present,
  // values are comma-joined ("v1, v2") as for list-style headers like Accept.
  HttpRequest& addHeader(std::string_view key, std::string_view value) &;
  HttpRequest&& addHeader(std::string_view key, std::string_view value) && { return std::move(addHeader(key, value)); }

  // Returns the (possibly merged) header value for the given key, or std::nullopt if absent.
  // Lookup is case-insensitive. A present but empty header is returned as an engaged empty value.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  // Like headerValue() but returns an empty string_view for absent headers.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Sets the body received by the transport.
  HttpRequest& body(std::string body) &;
  HttpRequest&& body(std::string body) && { return std::move(this->body(std::move(body))); }

  // Records that the transport failed to deliver the body. The given status and reason are surfaced as-is
  // to whoever tries to read the body.
  HttpRequest& bodyUnavailable(http::StatusCode status, std::string_view reason) &;
  HttpRequest&& bodyUnavailable(http::StatusCode status, std::string_view reason) && {
    return std::move(bodyUnavailable(status, reason));
  }

  // Reads the whole body. The body stream can be consumed only once: a second call throws std::logic_error.
  // Returns std::nullopt if the transport reported a failure, see bodyFailureStatus() and bodyFailureReason().
  // The returned view is valid as long as this HttpRequest.
  [[nodiscard]] std::optional<std::string_view> consumeBody();

  // Tells whether consumeBody() has been called.
  [[nodiscard]] bool bodyConsumed() const noexcept { return _bodyConsumed; }

  // Transport failure status, 0 if the body was delivered.
  [[nodiscard]] http::StatusCode bodyFailureStatus() const noexcept { return _bodyFailureStatus; }

  [[nodiscard]] std::string_view bodyFailureReason() const noexcept { return _bodyFailureReason; }

  // Records that the body could not be turned into a typed value (see DecodeRequestBody).
  void markBodyDecodeFailed() noexcept { _bodyDecodeFailed = true; }

  [[nodiscard]] bool bodyDecodeFailed() const noexcept { return _bodyDecodeFailed; }

 private:
  struct HeaderField {
    std::string name;
    std::string value;
  };

  std::string _path;
  SmallVector<HeaderField, 8> _headers;
  std::string _body;
  std::string _bodyFailureReason;
  http::StatusCode _bodyFailureStatus{0};
  bool _bodyConsumed{false};
  bool _bodyDecodeFailed{false};
};

}  // namespace conneg
