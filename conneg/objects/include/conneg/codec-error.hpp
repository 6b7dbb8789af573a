#pragma once

#include <cassert>
#include <optional>
#include <string>
#include <utility>

#include "conneg/media-type.hpp"

namespace conneg {

// Failure reported by a codec when it cannot encode a value or decode bytes.
// The message is meant for logs only: it may expose internal structure and is never sent to clients.
struct CodecError {
  MediaType mediaType;
  std::string message;
};

// Represents the result of a codec operation, which can either be a success or a CodecError.
class CodecResult {
 public:
  CodecResult() noexcept = default;

  explicit CodecResult(CodecError error) : _error(std::move(error)) {}

  [[nodiscard]] bool hasError() const noexcept { return _error.has_value(); }

  [[nodiscard]] const CodecError &error() const noexcept {
    assert(hasError());
    return *_error;
  }

 private:
  std::optional<CodecError> _error;
};

}  // namespace conneg
