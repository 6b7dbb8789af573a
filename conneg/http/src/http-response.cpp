#include "conneg/http-response.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "conneg/http-constants.hpp"
#include "conneg/http-status-code.hpp"
#include "conneg/string-equal-ignore-case.hpp"

namespace conneg {

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) : _reason(reason), _status(code) {}

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType) : _status(http::StatusCodeOK) {
  this->body(std::string(body), contentType);
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  for (const HeaderField& field : _headers) {
    if (CaseInsensitiveEqual(field.name, key)) {
      return std::string_view(field.value);
    }
  }
  return std::nullopt;
}

HttpResponse& HttpResponse::addHeader(std::string_view key, std::string_view value) & {
  _headers.emplace_back(std::string(key), std::string(value));
  return *this;
}

HttpResponse& HttpResponse::header(std::string_view key, std::string_view value) & {
  for (HeaderField& field : _headers) {
    if (CaseInsensitiveEqual(field.name, key)) {
      field.value.assign(value);
      return *this;
    }
  }
  return addHeader(key, value);
}

std::size_t HttpResponse::headerRemove(std::string_view key) noexcept {
  const auto newEnd = std::remove_if(_headers.begin(), _headers.end(),
                                     [key](const HeaderField& field) { return CaseInsensitiveEqual(field.name, key); });
  const auto nbRemoved = static_cast<std::size_t>(_headers.end() - newEnd);
  _headers.erase(newEnd, _headers.end());
  return nbRemoved;
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) & {
  _body = std::move(body);
  if (!_body.empty() && !contentType.empty()) {
    header(http::ContentType, contentType);
  }
  return *this;
}

}  // namespace conneg
