#include "conneg/http-request.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "conneg/http-status-code.hpp"
#include "conneg/string-equal-ignore-case.hpp"

namespace conneg {

HttpRequest::HttpRequest(std::string_view path) : _path(path) {}

HttpRequest& HttpRequest::addHeader(std::string_view key, std::string_view value) & {
  for (HeaderField& field : _headers) {
    if (CaseInsensitiveEqual(field.name, key)) {
      if (field.value.empty()) {
        field.value.assign(value);
      } else if (!value.empty()) {
        field.value.append(", ");
        field.value.append(value);
      }
      return *this;
    }
  }
  _headers.emplace_back(std::string(key), std::string(value));
  return *this;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view key) const noexcept {
  for (const HeaderField& field : _headers) {
    if (CaseInsensitiveEqual(field.name, key)) {
      return std::string_view(field.value);
    }
  }
  return std::nullopt;
}

HttpRequest& HttpRequest::body(std::string body) & {
  _body = std::move(body);
  return *this;
}

HttpRequest& HttpRequest::bodyUnavailable(http::StatusCode status, std::string_view reason) & {
  _bodyFailureStatus = status;
  _bodyFailureReason.assign(reason);
  return *this;
}

std::optional<std::string_view> HttpRequest::consumeBody() {
  if (_bodyConsumed) {
    throw std::logic_error("Request body can only be consumed once");
  }
  _bodyConsumed = true;
  if (_bodyFailureStatus != 0) {
    return std::nullopt;
  }
  return std::string_view(_body);
}

}  // namespace conneg
